#include <gtest/gtest.h>
#include "core/errors/gateway_errors.hpp"

using namespace docgate::core::errors;

// A dummy lookup that fails the way a stale live document does
Result<std::string> simulate_lookup(bool should_fail) {
    if (should_fail) {
        return GatewayError{ErrorKind::StaleHandle, "Document was closed", "stale_handle"};
    }
    return std::string("doc-1");
}

TEST(ErrorModelTest, HandlesSuccess) {
    auto result = simulate_lookup(false);

    EXPECT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "doc-1");
}

TEST(ErrorModelTest, HandlesFailure) {
    auto result = simulate_lookup(true);

    EXPECT_TRUE(is_error(result));

    auto error = get_error(result);
    EXPECT_EQ(error.kind, ErrorKind::StaleHandle);
    EXPECT_EQ(error.message, "Document was closed");
    EXPECT_EQ(error.code, "stale_handle");
    EXPECT_TRUE(error.hint.empty());
}

TEST(ErrorModelTest, StatusCarriesNoValue) {
    Status done = ok();
    EXPECT_FALSE(is_error(done));

    Status failed = GatewayError{ErrorKind::Internal, "boom"};
    ASSERT_TRUE(is_error(failed));
    EXPECT_EQ(get_error(failed).code, "unknown_error");
}

TEST(ErrorModelTest, WireTypesAreDistinctPerKind) {
    EXPECT_EQ(to_wire_type(ErrorKind::Validation), "ValidationError");
    EXPECT_EQ(to_wire_type(ErrorKind::UnsupportedFormat), "UnsupportedFormatError");
    EXPECT_EQ(to_wire_type(ErrorKind::EngineUnreachable), "EngineUnreachableError");
    EXPECT_EQ(to_wire_type(ErrorKind::StaleHandle), "StaleHandleError");
    EXPECT_EQ(to_wire_type(ErrorKind::ConversionFailed), "ConversionFailed");
    EXPECT_EQ(to_wire_type(ErrorKind::ConversionTimedOut), "ConversionTimedOut");
    EXPECT_EQ(to_wire_type(ErrorKind::NoActiveDocument), "NoActiveDocumentError");
    EXPECT_EQ(to_wire_type(ErrorKind::NoSelection), "NoSelectionError");
    EXPECT_EQ(to_wire_type(ErrorKind::Timeout), "TimeoutError");
    EXPECT_EQ(to_wire_type(ErrorKind::Internal), "InternalError");
}
