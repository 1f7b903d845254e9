#include <session/EntityExtractor.h>

#include <folly/portability/GTest.h>
#include <folly/portability/GMock.h>
#include <folly/dynamic.h>

using namespace testing;

static std::vector<EntityType> typesOf(const Extraction& ex) {
  std::vector<EntityType> types;
  for (const ExtractedEntity& e : ex.entities)
    types.push_back(e.type);
  return types;
}

static const ExtractedEntity* findType(const Extraction& ex, EntityType type) {
  for (const ExtractedEntity& e : ex.entities) {
    if (e.type == type)
      return &e;
  }
  return nullptr;
}

TEST(EntityExtractor, Empty) {
  EXPECT_TRUE(extractEntities("").entities.empty());
  EXPECT_TRUE(extractEntities("hello, how are you today?").entities.empty());
}

TEST(EntityExtractor, OneTimeCodeNeedsContext) {
  Extraction ex = extractEntities("read me the otp 482913 now", 7);
  ASSERT_THAT(typesOf(ex), ElementsAre(EntityType::ONE_TIME_CODE));
  const ExtractedEntity& otp = ex.entities[0];
  EXPECT_THAT(otp.original, Eq("482913"));
  EXPECT_THAT(otp.masked, Eq("XXXX13"));
  EXPECT_EQ(otp.position.sequence, 7);
  EXPECT_EQ(otp.position.offset, 16);
  EXPECT_EQ(otp.position.length, 6);
  EXPECT_GE(otp.confidence, 0.3);

  EXPECT_TRUE(extractEntities("we met at 482913 yesterday").entities.empty());
}

TEST(EntityExtractor, PaymentHandle) {
  Extraction ex = extractEntities("send it to rahul.k@ybl quickly");
  ASSERT_THAT(typesOf(ex), ElementsAre(EntityType::PAYMENT_HANDLE));
  EXPECT_THAT(ex.entities[0].original, Eq("rahul.k@ybl"));
  EXPECT_TRUE(ex.entities[0].verified);

  ex = extractEntities("upi id is scam99@unknownbank.");
  ASSERT_THAT(typesOf(ex), ElementsAre(EntityType::PAYMENT_HANDLE));
  EXPECT_FALSE(ex.entities[0].verified);
}

TEST(EntityExtractor, EmailIsNotHandle) {
  Extraction ex = extractEntities("mail the form to support@secure-bank.com");
  ASSERT_THAT(typesOf(ex), ElementsAre(EntityType::EMAIL));
  EXPECT_THAT(ex.entities[0].original, Eq("support@secure-bank.com"));
}

TEST(EntityExtractor, PhoneNumbers) {
  Extraction ex = extractEntities("call me back on 9876543210");
  ASSERT_THAT(typesOf(ex), ElementsAre(EntityType::PHONE_NUMBER));
  EXPECT_THAT(ex.entities[0].original, Eq("+919876543210"));
  EXPECT_THAT(ex.entities[0].masked, Eq("+919876543210"));

  ex = extractEntities("my whatsapp is +91 98765 43210");
  ASSERT_THAT(typesOf(ex), ElementsAre(EntityType::PHONE_NUMBER));
  EXPECT_THAT(ex.entities[0].original, Eq("+919876543210"));
  EXPECT_EQ(ex.entities[0].position.offset, 15);
  EXPECT_EQ(ex.entities[0].position.length, 15);
}

TEST(EntityExtractor, CardNumberLuhn) {
  Extraction ex = extractEntities("my debit card is 4111 1111 1111 1111");
  ASSERT_THAT(typesOf(ex), ElementsAre(EntityType::CARD_NUMBER));
  EXPECT_THAT(ex.entities[0].original, Eq("4111111111111111"));
  EXPECT_THAT(ex.entities[0].masked, Eq("XXXXXXXXXXXX1111"));
  EXPECT_TRUE(ex.entities[0].verified);

  ex = extractEntities("my debit card is 4111 1111 1111 1112", 6);
  EXPECT_EQ(findType(ex, EntityType::CARD_NUMBER), nullptr);
  ASSERT_EQ(ex.malformed.size(), 1);
  EXPECT_EQ(ex.malformed[0].type, EntityType::CARD_NUMBER);

  GuardError err = toError(ex.malformed[0]);
  EXPECT_TRUE(err.is(GUARD_MALFORMED_ENTITY));
  EXPECT_EQ(err.http_status(), 422);
  EXPECT_THAT(err.describe(), StartsWith("Candidate 'card-number' at 6:"));
  EXPECT_THAT(err.describe(), HasSubstr("luhn"));
  EXPECT_THAT(err.describe(), Not(HasSubstr("1112")));
}

TEST(EntityExtractor, NationalId) {
  Extraction ex = extractEntities("aadhaar number 2345 6789 0123 please");
  ASSERT_THAT(typesOf(ex), ElementsAre(EntityType::NATIONAL_ID));
  EXPECT_THAT(ex.entities[0].masked, Eq("XXXXXXXX0123"));

  ex = extractEntities("aadhaar number 1234 5678 9012");
  EXPECT_EQ(findType(ex, EntityType::NATIONAL_ID), nullptr);
  EXPECT_THAT(ex.malformed, SizeIs(1));
}

TEST(EntityExtractor, TaxIdAndRoutingCode) {
  Extraction ex = extractEntities("pan is abcpe1234f and ifsc SBIN0001234");
  ASSERT_THAT(typesOf(ex), ElementsAre(EntityType::TAX_ID,
                                       EntityType::BANK_ROUTING_CODE));
  EXPECT_THAT(ex.entities[0].original, Eq("ABCPE1234F"));
  EXPECT_THAT(ex.entities[0].masked, Eq("ABXXXXXX4F"));
  EXPECT_TRUE(ex.entities[0].verified);
  EXPECT_THAT(ex.entities[1].original, Eq("SBIN0001234"));
}

TEST(EntityExtractor, BankAccountNeedsContext) {
  Extraction ex = extractEntities("transfer to account 123456789012345");
  ASSERT_THAT(typesOf(ex), ElementsAre(EntityType::BANK_ACCOUNT));
  EXPECT_THAT(ex.entities[0].masked, Eq("XXXXXXXXXXX2345"));

  EXPECT_EQ(findType(extractEntities("ticket 123456789012345"),
                     EntityType::BANK_ACCOUNT), nullptr);
}

TEST(EntityExtractor, MonetaryAmount) {
  Extraction ex = extractEntities("pay a fee of Rs. 5,000 today");
  ASSERT_THAT(typesOf(ex), ElementsAre(EntityType::MONETARY_AMOUNT));
  EXPECT_THAT(ex.entities[0].original, Eq("Rs. 5,000"));

  ex = extractEntities("the fine is 2 lakh rupees");
  ASSERT_NE(findType(ex, EntityType::MONETARY_AMOUNT), nullptr);
  EXPECT_EQ(findType(ex, EntityType::ONE_TIME_CODE), nullptr);
}

TEST(EntityExtractor, NamesAndLocations) {
  Extraction ex = extractEntities("This is Officer Vikram Singh from Mumbai branch");
  ASSERT_THAT(typesOf(ex), ElementsAre(EntityType::PERSON_NAME,
                                       EntityType::LOCATION));
  EXPECT_THAT(ex.entities[0].original, Eq("Vikram Singh"));
  EXPECT_THAT(ex.entities[1].original, Eq("Mumbai"));

  ex = extractEntities("this is the bank calling");
  EXPECT_EQ(findType(ex, EntityType::PERSON_NAME), nullptr);
}

TEST(EntityExtractor, NoOverlapsAndOrdered) {
  Extraction ex = extractEntities(
      "otp 482913, card 4111111111111111, upi fraud@okaxis, call 9876543210");
  ASSERT_THAT(typesOf(ex), ElementsAre(EntityType::ONE_TIME_CODE,
                                       EntityType::CARD_NUMBER,
                                       EntityType::PAYMENT_HANDLE,
                                       EntityType::PHONE_NUMBER));
  for (size_t i = 1; i < ex.entities.size(); ++i) {
    const SourcePosition& prev = ex.entities[i - 1].position;
    EXPECT_LE(prev.offset + prev.length, ex.entities[i].position.offset);
  }
}

TEST(EntityExtractor, Deterministic) {
  const char* text = "my name is Ramesh, pay 999 rupees to ramesh@paytm, otp 1234";
  Extraction a = extractEntities(text, 3);
  Extraction b = extractEntities(text, 3);
  ASSERT_EQ(a.entities.size(), b.entities.size());
  for (size_t i = 0; i < a.entities.size(); ++i) {
    EXPECT_EQ(a.entities[i].type, b.entities[i].type);
    EXPECT_EQ(a.entities[i].original, b.entities[i].original);
    EXPECT_EQ(a.entities[i].confidence, b.entities[i].confidence);
  }
}

TEST(EntityExtractor, MaskNeverEqualsSensitiveOriginal) {
  const char* samples[] = { "1", "12", "1234", "482913", "4111111111111111",
                            "234567890123" };
  for (const char* s : samples) {
    for (EntityType t : { EntityType::ONE_TIME_CODE, EntityType::CARD_NUMBER,
                          EntityType::NATIONAL_ID, EntityType::BANK_ACCOUNT }) {
      SCOPED_TRACE(s);
      std::string masked = maskEntity(t, s);
      EXPECT_NE(masked, s);
      EXPECT_EQ(masked.size(), strlen(s));
      EXPECT_EQ(masked, maskEntity(t, s));
    }
  }
  EXPECT_THAT(maskEntity(EntityType::TAX_ID, "ABCPE1234F"), Eq("ABXXXXXX4F"));
}

TEST(EntityExtractor, DisplayJsonHasNoOriginal) {
  Extraction ex = extractEntities("the otp is 482913");
  ASSERT_THAT(ex.entities, SizeIs(1));
  folly::dynamic shown = toJson(ex.entities[0].view());
  EXPECT_THAT(shown["value"].asString(), Eq("XXXX13"));
  EXPECT_EQ(shown.count("original"), 0);
  EXPECT_THAT(toEvidenceJson(ex.entities[0])["original"].asString(), Eq("482913"));
}

TEST(EntityExtractor, Luhn) {
  EXPECT_TRUE(luhnValid("4111111111111111"));
  EXPECT_TRUE(luhnValid("79927398713"));
  EXPECT_FALSE(luhnValid("79927398710"));
  EXPECT_FALSE(luhnValid(""));
  EXPECT_FALSE(luhnValid("4111-1111"));
}
