/*
* (C) 2025 Ordo Developers
*
* Ordo is released under the Simplified BSD License (see license.txt)
*/

#include "tests.h"

#if defined(ORDO_HAS_ASN1)
   #include "test_der_utils.h"
   #include <ordo/asn1_int.h>
   #include <ordo/asn1_obj.h>
   #include <ordo/asn1_seq.h>
   #include <ordo/asn1_str.h>
   #include <ordo/hex.h>
   #include <array>
#endif

namespace Ordo_Tests {

#if defined(ORDO_HAS_ASN1)

namespace {

/*
* Record ::= SEQUENCE {
*    version  INTEGER,
*    data     OCTET STRING,
*    critical BOOLEAN
* }
*/
class Test_Record final : public Ordo::Message {
   public:
      Test_Record(int version, std::span<const uint8_t> data, bool critical) :
            m_version(version), m_data(data), m_critical(critical) {}

      int version() const { return m_version.value(); }

      std::span<const uint8_t> data() const { return m_data.value(); }

      bool critical() const { return m_critical.value(); }

      static Test_Record decode(Ordo::DER_Decoder& decoder) {
         return decoder.sequence([](Ordo::DER_Decoder& body) {
            const int version = body.integer<int>();
            const auto data = body.octet_string();
            const bool critical = body.boolean();
            return Test_Record(version, data.value(), critical);
         });
      }

      void fields(const Fields_Callback& f) const override {
         const std::array<const Ordo::Encodable*, 3> list = {&m_version, &m_data, &m_critical};
         f(list);
      }

   private:
      Ordo::Integer<int> m_version;
      Ordo::OctetString m_data;
      Ordo::Boolean m_critical;
};

const char* const TEST_RECORD_DER = "300A0201010402ABCD0101FF";

std::vector<Test::Result> test_asn1_message() {
   return {
      CHECK("encoding",
            [](Test::Result& result) {
               const std::vector<uint8_t> data = {0xAB, 0xCD};
               const Test_Record record(1, data, true);

               result.test_eq("encoded_len", record.encoded_len().value(), 12);
               result.test_eq("to_der", record.to_der(), Ordo::hex_decode(TEST_RECORD_DER));
            }),

      CHECK("decoding",
            [](Test::Result& result) {
               const auto der = Ordo::hex_decode(TEST_RECORD_DER);
               Ordo::DER_Decoder dec(der);
               const auto record = dec.finish(dec.decode<Test_Record>());

               result.test_int_eq("version", record.version(), 1);
               result.test_eq("data", record.data(), "ABCD");
               result.confirm("critical", record.critical());
               result.test_eq("encoding", record.to_der(), der);
            }),

      CHECK("every truncation is rejected",
            [](Test::Result& result) {
               const auto der = Ordo::hex_decode(TEST_RECORD_DER);

               for(size_t len = 0; len != der.size(); ++len) {
                  const auto prefix = std::span<const uint8_t>(der).first(len);
                  const auto err = catch_der_error([&] {
                     Ordo::DER_Decoder dec(prefix);
                     dec.finish(dec.decode<Test_Record>());
                  });
                  result.confirm("prefix of " + std::to_string(len) + " bytes rejected", err.has_value());
               }
            }),

      CHECK("trailing data",
            [](Test::Result& result) {
               const auto der = Ordo::hex_decode(std::string(TEST_RECORD_DER) + "00");
               test_der_error(result, "extra byte", Ordo::DER_ErrorKind::TrailingData, [&] {
                  Ordo::DER_Decoder dec(der);
                  dec.finish(dec.decode<Test_Record>());
               });
            }),

      CHECK("fields in the wrong order",
            [](Test::Result& result) {
               const auto der = Ordo::hex_decode("300A0402ABCD0201010101FF");
               const auto err = catch_der_error([&] {
                  Ordo::DER_Decoder dec(der);
                  dec.decode<Test_Record>();
               });
               result.require("rejected", err.has_value());
               result.confirm("kind", err->kind() == Ordo::DER_ErrorKind::UnexpectedTag);
               result.confirm("position", err->position() == size_t(2));
            }),
   };
}

ORDO_REGISTER_SMOKE_TEST_FN("asn1", "asn1_message", test_asn1_message);

std::vector<Test::Result> test_asn1_sequence() {
   return {
      CHECK("raw sequences",
            [](Test::Result& result) {
               const auto der = Ordo::hex_decode("3006020101020102");
               Ordo::DER_Decoder dec(der);
               const auto seq = dec.finish(dec.decode<Ordo::Sequence>());

               result.test_eq("body", seq.as_bytes(), "020101020102");
               result.test_eq("encoding", seq.to_der(), der);

               const int sum = seq.decode_nested([](Ordo::DER_Decoder& body) {
                  const int a = body.integer<int>();
                  const int b = body.integer<int>();
                  return a + b;
               });
               result.test_int_eq("decode_nested", sum, 3);

               test_der_error(result, "partially read", Ordo::DER_ErrorKind::TrailingData, [&] {
                  seq.decode_nested([](Ordo::DER_Decoder& body) { return body.integer<int>(); });
               });

               auto body = seq.decoder();
               result.test_int_eq("decoder", body.integer<int>(), 1);
            }),

      CHECK("iteration",
            [](Test::Result& result) {
               const auto der = Ordo::hex_decode("3009020101020102020103");
               const auto seq = Ordo::Sequence::from_any(Ordo::Any::from_der(der));

               std::vector<int> values;
               for(const auto& i : Ordo::SequenceIter<Ordo::Integer<int>>(seq)) {
                  values.push_back(i.value());
               }
               result.confirm("all elements", values == std::vector<int>{1, 2, 3});

               const auto empty = Ordo::hex_decode("3000");
               Ordo::SequenceIter<Ordo::Integer<int>> none(Ordo::Sequence::from_any(Ordo::Any::from_der(empty)));
               result.test_is_nullopt("empty sequence", none.next());
            }),

      CHECK("iteration over mixed types",
            [](Test::Result& result) {
               const auto body = Ordo::hex_decode("0201010500");
               Ordo::SequenceIter<Ordo::Integer<int>> iter{Ordo::DER_Decoder(body)};

               result.test_not_nullopt("first element", iter.next());
               test_der_error(result, "NULL as INTEGER", Ordo::DER_ErrorKind::UnexpectedTag, [&] { iter.next(); });
               test_der_error(result, "after an error", Ordo::DER_ErrorKind::Failed, [&] { iter.next(); });
            }),
   };
}

ORDO_REGISTER_SMOKE_TEST_FN("asn1", "asn1_sequence", test_asn1_sequence);

std::vector<Test::Result> test_asn1_set_of() {
   using Int_Set_Ref = Ordo::SetOfRef<Ordo::Integer<int>>;
   using Int_Set = Ordo::SetOf<Ordo::Integer<int>>;

   return {
      CHECK("sorted elements",
            [](Test::Result& result) {
               const auto body = Ordo::hex_decode("020101020102");
               const auto set = Int_Set_Ref::create(body);

               std::vector<int> values;
               for(const auto& i : set.elements()) {
                  values.push_back(i.value());
               }
               result.confirm("elements", values == std::vector<int>{1, 2});
               result.test_eq("encoding", set.to_der(), Ordo::hex_decode("3106020101020102"));
            }),

      CHECK("ordering is enforced",
            [](Test::Result& result) {
               const auto reversed = Ordo::hex_decode("020102020101");
               const auto err = catch_der_error([&] { Int_Set_Ref::create(reversed); });
               result.require("reversed rejected", err.has_value());
               result.confirm("kind", err->kind() == Ordo::DER_ErrorKind::Noncanonical);
               result.confirm("position of the second element", err->position() == size_t(3));

               const auto duplicate = Ordo::hex_decode("020101020101");
               test_der_error(result, "duplicate elements", Ordo::DER_ErrorKind::Noncanonical, [&] {
                  Int_Set_Ref::create(duplicate);
               });

               // 0x0201.. sorts before 0x0202.. even though 300 > 2
               const auto by_encoding = Ordo::hex_decode("0201020202012C");
               result.test_no_throw("ordered by encoding", [&] { Int_Set_Ref::create(by_encoding); });
            }),

      CHECK("decoding",
            [](Test::Result& result) {
               const auto der = Ordo::hex_decode("3106020101020102");
               Ordo::DER_Decoder dec(der);
               const auto set = dec.finish(dec.decode<Int_Set_Ref>());
               result.test_eq("body", set.as_bytes(), "020101020102");

               const auto seq = Ordo::hex_decode("3006020101020102");
               test_der_error(result, "SEQUENCE as SET", Ordo::DER_ErrorKind::UnexpectedTag, [&] {
                  Ordo::DER_Decoder d(seq);
                  d.decode<Int_Set_Ref>();
               });
            }),

      CHECK("owned sets",
            [](Test::Result& result) {
               Int_Set set;
               result.confirm("starts empty", set.empty());

               set.insert(Ordo::Integer<int>(300));
               set.insert(Ordo::Integer<int>(2));
               set.insert(Ordo::Integer<int>(1));
               result.test_eq("size", set.size(), 3);

               std::vector<int> values;
               for(const auto& i : set) {
                  values.push_back(i.value());
               }
               result.confirm("sorted by encoding", values == std::vector<int>{1, 2, 300});

               test_der_error(
                  result, "duplicate insert", Ordo::DER_ErrorKind::Noncanonical, [&] { set.insert(Ordo::Integer<int>(2)); });
               result.test_eq("size unchanged", set.elements().size(), 3);

               const auto der = Ordo::hex_decode("310A0201010201020202012C");
               result.test_eq("encoding", set.to_der(), der);

               Ordo::DER_Decoder dec(der);
               const auto decoded = dec.finish(dec.decode<Int_Set>());
               result.confirm("decoded", decoded == set);

               const auto unsorted = Ordo::hex_decode("3106020102020101");
               test_der_error(result, "unsorted input", Ordo::DER_ErrorKind::Noncanonical, [&] {
                  Int_Set::from_any(Ordo::Any::from_der(unsorted));
               });
            }),
   };
}

ORDO_REGISTER_SMOKE_TEST_FN("asn1", "asn1_set_of", test_asn1_set_of);

}  // namespace

#endif

}  // namespace Ordo_Tests
