/**
 * Unit tests for the layered error taxonomy
 *
 * The DomainError -> CompositeError rule must be total and lossless, and a
 * codec error must survive being wrapped as a serialization failure.
 */

#include "common/errors.h"
#include <gtest/gtest.h>
#include <set>

using namespace solcore::common;

TEST(ErrorTaxonomyTest, EveryDomainErrorMapsToDomainComposite) {
    for (DomainError error : ALL_DOMAIN_ERRORS) {
        CompositeError composite = to_composite(error);
        EXPECT_EQ(composite.kind(), CompositeError::Kind::Domain);
        ASSERT_TRUE(composite.domain_error().has_value());
        EXPECT_EQ(*composite.domain_error(), error);
        EXPECT_FALSE(composite.codec_error().has_value());
        EXPECT_FALSE(composite.network_message().has_value());
    }
}

TEST(ErrorTaxonomyTest, DistinctDomainErrorsStayDistinct) {
    std::set<std::string> rendered;
    for (size_t i = 0; i < ALL_DOMAIN_ERRORS.size(); ++i) {
        for (size_t j = 0; j < ALL_DOMAIN_ERRORS.size(); ++j) {
            bool same = to_composite(ALL_DOMAIN_ERRORS[i]) == to_composite(ALL_DOMAIN_ERRORS[j]);
            EXPECT_EQ(same, i == j);
        }
        rendered.insert(error_code(ALL_DOMAIN_ERRORS[i]));
    }
    EXPECT_EQ(rendered.size(), ALL_DOMAIN_ERRORS.size());
}

TEST(ErrorTaxonomyTest, CodecErrorWrapsAsSerialization) {
    CodecError cause = CodecError::unknown_instruction(0x7f);
    CompositeError composite = to_composite(cause);

    EXPECT_EQ(composite.kind(), CompositeError::Kind::Serialization);
    ASSERT_TRUE(composite.codec_error().has_value());
    EXPECT_EQ(*composite.codec_error(), cause);
    EXPECT_EQ(composite.codec_error()->byte, 0x7f);
    EXPECT_FALSE(composite.domain_error().has_value());
}

TEST(ErrorTaxonomyTest, NetworkErrorKeepsMessage) {
    CompositeError composite(NetworkError{"Timeout"});
    EXPECT_EQ(composite.kind(), CompositeError::Kind::Network);
    EXPECT_EQ(composite.network_message().value_or(""), "Timeout");
    EXPECT_EQ(to_string(composite), "network error: Timeout");
}

TEST(ErrorTaxonomyTest, SerializationWithoutCause) {
    CompositeError composite(SerializationError{});
    EXPECT_EQ(composite.kind(), CompositeError::Kind::Serialization);
    EXPECT_FALSE(composite.codec_error().has_value());
    EXPECT_EQ(to_string(composite), "serialization error");
}

TEST(ErrorTaxonomyTest, CodecErrorFactoriesFillRelevantFields) {
    auto truncated = CodecError::truncated(12, 5, "Transfer");
    EXPECT_EQ(truncated.kind, CodecErrorKind::TruncatedInput);
    EXPECT_EQ(truncated.expected, 12u);
    EXPECT_EQ(truncated.actual, 5u);
    EXPECT_EQ(to_string(truncated), "truncated input reading Transfer: need 12 bytes, have 5");

    auto mismatch = CodecError::field_count_mismatch(2, 1);
    EXPECT_EQ(mismatch.kind, CodecErrorKind::FieldCountMismatch);
    EXPECT_EQ(to_string(mismatch), "field count mismatch: expected 2, got 1");

    auto invalid = CodecError::invalid_encoding("name");
    EXPECT_EQ(to_string(invalid), "invalid encoding in field 'name'");

    EXPECT_EQ(to_string(CodecError::unknown_instruction(9)), "unknown instruction type: 9");
}

TEST(ErrorTaxonomyTest, HumanTextOnlyAtBoundary) {
    EXPECT_EQ(to_string(to_composite(DomainError::InsufficientBalance)),
              "domain error: insufficient balance");
    EXPECT_EQ(to_string(to_composite(CodecError::unknown_instruction(200))),
              "serialization error: unknown instruction type: 200");
}
