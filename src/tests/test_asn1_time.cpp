/*
* ASN.1 Time Tests
* (C) 2017 Jack Lloyd
*     2025 Ordo Developers
*
* Ordo is released under the Simplified BSD License (see license.txt)
*/

#include "tests.h"

#if defined(ORDO_HAS_ASN1_TIME)
   #include "test_der_utils.h"
   #include <ordo/asn1_time.h>
   #include <ordo/hex.h>
#endif

namespace Ordo_Tests {

#if defined(ORDO_HAS_ASN1_TIME)

namespace {

std::vector<Test::Result> test_utc_time() {
   return {
      CHECK("fields",
            [](Test::Result& result) {
               const Ordo::UtcTime t(2017, 1, 2, 3, 4, 5);

               result.test_int_eq("year", t.year(), 2017);
               result.test_int_eq("month", t.month(), 1);
               result.test_int_eq("second", t.second(), 5);
               result.test_eq("to_string", t.to_string(), "170102030405Z");
               result.test_eq("readable_string", t.readable_string(), "2017/01/02 03:04:05 UTC");
               result.test_eq("encoding", t.to_der(), Ordo::hex_decode("170D3137303130323033303430355A"));
               result.test_eq("encoded_len", t.encoded_len().value(), 15);
            }),

      CHECK("two digit years",
            [](Test::Result& result) {
               result.test_int_eq("49", Ordo::UtcTime::from_string("491231235959Z").year(), 2049);
               result.test_int_eq("50", Ordo::UtcTime::from_string("500101000000Z").year(), 1950);
               result.test_int_eq("99", Ordo::UtcTime::from_string("991231235959Z").year(), 1999);
               result.test_int_eq("00", Ordo::UtcTime::from_string("000101000000Z").year(), 2000);

               test_der_error(result, "year 2050", Ordo::DER_ErrorKind::Value, [] { Ordo::UtcTime t(2050, 1, 1, 0, 0, 0); });
               test_der_error(result, "year 1949", Ordo::DER_ErrorKind::Value, [] { Ordo::UtcTime t(1949, 12, 31, 0, 0, 0); });
            }),

      CHECK("malformed strings",
            [](Test::Result& result) {
               const std::vector<std::string> bad = {
                  "",
                  "4912312359Z",
                  "491231235959",
                  "491231235959+0100",
                  "491231235959z",
                  "49123123595aZ",
                  "491331235959Z",
                  "491200235959Z",
                  "490229000000Z",
                  "491231245959Z",
                  "491231236059Z",
                  "491231235960Z",
                  "20491231235959Z",
               };

               for(const auto& str : bad) {
                  test_der_error(result, "'" + str + "'", Ordo::DER_ErrorKind::Value, [&] { Ordo::UtcTime::from_string(str); });
               }

               result.test_no_throw("leap day", [] { Ordo::UtcTime::from_string("480229000000Z"); });
            }),

      CHECK("time points",
            [](Test::Result& result) {
               const auto tp = std::chrono::system_clock::from_time_t(1500000000);
               const Ordo::UtcTime t(tp);

               result.test_eq("from time_point", t.to_string(), "170714024000Z");
               result.confirm("to time_point", t.to_std_timepoint() == tp);

               const Ordo::UtcTime epoch(1970, 1, 1, 0, 0, 0);
               result.confirm("epoch", epoch.to_std_timepoint() == std::chrono::system_clock::from_time_t(0));

               result.test_throws("before 1970", [] { Ordo::UtcTime(1969, 12, 31, 23, 59, 59).to_std_timepoint(); });
            }),

      CHECK("comparison",
            [](Test::Result& result) {
               const Ordo::UtcTime a(1999, 12, 31, 23, 59, 59);
               const Ordo::UtcTime b(2000, 1, 1, 0, 0, 0);

               result.confirm("earlier", a < b);
               result.confirm("later", b > a);
               result.confirm("equal", a == Ordo::UtcTime::from_string("991231235959Z"));
            }),

      CHECK("decoding",
            [](Test::Result& result) {
               const auto der = Ordo::hex_decode("170D3137303130323033303430355A");
               Ordo::DER_Decoder dec(der);
               const auto t = dec.finish(dec.decode<Ordo::UtcTime>());
               result.confirm("value", t == Ordo::UtcTime(2017, 1, 2, 3, 4, 5));

               result.confirm("Any::utc_time", Ordo::Any::from_der(der).utc_time() == t);

               const auto gt = Ordo::hex_decode("180F32303530303130313030303030305A");
               test_der_error(result, "GeneralizedTime as UTCTime", Ordo::DER_ErrorKind::UnexpectedTag, [&] {
                  Ordo::DER_Decoder d(gt);
                  d.decode<Ordo::UtcTime>();
               });
            }),
   };
}

ORDO_REGISTER_SMOKE_TEST_FN("asn1", "asn1_utc_time", test_utc_time);

std::vector<Test::Result> test_generalized_time() {
   return {
      CHECK("fields",
            [](Test::Result& result) {
               const Ordo::GeneralizedTime t(2050, 1, 1, 0, 0, 0);
               result.test_eq("to_string", t.to_string(), "20500101000000Z");
               result.test_eq("readable_string", t.readable_string(), "2050/01/01 00:00:00 UTC");
               result.test_eq("encoding", t.to_der(), Ordo::hex_decode("180F32303530303130313030303030305A"));

               const auto max = Ordo::GeneralizedTime::from_string("99991231235959Z");
               result.test_int_eq("year 9999", max.year(), 9999);

               const auto early = Ordo::GeneralizedTime::from_string("16000229120000Z");
               result.test_int_eq("year 1600", early.year(), 1600);
               result.test_eq("round trip", early.to_string(), "16000229120000Z");
               result.test_throws("before 1970", [&] { early.to_std_timepoint(); });
            }),

      CHECK("malformed strings",
            [](Test::Result& result) {
               const std::vector<std::string> bad = {
                  "20500101000000",
                  "20500101000000.5Z",
                  "205001010000Z",
                  "20500101000000+0000",
                  "21000229000000Z",
                  "20501301000000Z",
                  "20500101000060Z",
                  "500101000000Z",
               };

               for(const auto& str : bad) {
                  test_der_error(
                     result, "'" + str + "'", Ordo::DER_ErrorKind::Value, [&] { Ordo::GeneralizedTime::from_string(str); });
               }

               test_der_error(result, "year 10000", Ordo::DER_ErrorKind::Value, [] {
                  Ordo::GeneralizedTime t(10000, 1, 1, 0, 0, 0);
               });
            }),

      CHECK("time points",
            [](Test::Result& result) {
               const auto tp = std::chrono::system_clock::from_time_t(2556144000);
               const Ordo::GeneralizedTime t(tp);
               result.test_eq("from time_point", t.to_string(), "20510101000000Z");
               result.confirm("to time_point", t.to_std_timepoint() == tp);
            }),
   };
}

ORDO_REGISTER_SMOKE_TEST_FN("asn1", "asn1_generalized_time", test_generalized_time);

std::vector<Test::Result> test_asn1_time_choice() {
   return {
      CHECK("make_time",
            [](Test::Result& result) {
               const auto before = std::chrono::system_clock::from_time_t(1500000000);
               const Ordo::Time t1 = Ordo::make_time(before);
               result.confirm("UTCTime through 2049", t1.holds<Ordo::UtcTime>());
               result.confirm("to_std_timepoint", Ordo::to_std_timepoint(t1) == before);

               const auto after = std::chrono::system_clock::from_time_t(2556144000);
               const Ordo::Time t2 = Ordo::make_time(after);
               result.confirm("GeneralizedTime from 2050", t2.holds<Ordo::GeneralizedTime>());
               result.confirm("to_std_timepoint", Ordo::to_std_timepoint(t2) == after);
            }),

      CHECK("decoding",
            [](Test::Result& result) {
               const auto utc = Ordo::hex_decode("170D3137303130323033303430355A");
               Ordo::DER_Decoder dec1(utc);
               const auto t1 = dec1.finish(dec1.decode<Ordo::Time>());
               result.confirm("UTCTime", t1.holds<Ordo::UtcTime>());
               result.test_eq("encoding", t1.to_der(), utc);

               const auto gen = Ordo::hex_decode("180F32303530303130313030303030305A");
               Ordo::DER_Decoder dec2(gen);
               const auto t2 = dec2.finish(dec2.decode<Ordo::Time>());
               result.require("GeneralizedTime", t2.holds<Ordo::GeneralizedTime>());
               result.test_int_eq("year", t2.get<Ordo::GeneralizedTime>().year(), 2050);

               const auto os = Ordo::hex_decode("0400");
               test_der_error(result, "OCTET STRING", Ordo::DER_ErrorKind::UnexpectedTag, [&] {
                  Ordo::DER_Decoder d(os);
                  d.decode<Ordo::Time>();
               });
            }),
   };
}

ORDO_REGISTER_SMOKE_TEST_FN("asn1", "asn1_time", test_asn1_time_choice);

}  // namespace

#endif

}  // namespace Ordo_Tests
