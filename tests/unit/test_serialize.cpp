// File: tests/unit/test_serialize.cpp
// Purpose: Verify how script results are turned into descriptor and
//          configuration text.
// Key invariants: Colors use forward byte order in descriptors and reversed
//                 order in configuration; floats never use exponent form.
// Ownership/Lifetime: Values are constructed locally per test.

#include <gtest/gtest.h>

#include "build/Serialize.hpp"
#include "support/DiagnosticCodes.hpp"

using namespace themebuild;
using build::Destination;
using build::serializeValue;
using script::Value;

TEST(Serialize, ScalarValues)
{
    EXPECT_EQ(serializeValue(Value(), Destination::Descriptor).value(), "");
    EXPECT_EQ(serializeValue(Value::boolean(true), Destination::Descriptor).value(), "true");
    EXPECT_EQ(serializeValue(Value::boolean(false), Destination::Config).value(), "false");
    EXPECT_EQ(serializeValue(Value::integer(-42), Destination::Descriptor).value(), "-42");
    EXPECT_EQ(serializeValue(Value::string("text 1"), Destination::Config).value(), "text 1");
}

TEST(Serialize, FloatsUseFixedNotation)
{
    EXPECT_EQ(build::formatFloat(0.5), "0.5");
    EXPECT_EQ(build::formatFloat(1.0), "1");
    EXPECT_EQ(build::formatFloat(1e20), "100000000000000000000");
    EXPECT_EQ(build::formatFloat(0.0001), "0.0001");
    EXPECT_EQ(build::formatFloat(-2.25), "-2.25");
    EXPECT_EQ(serializeValue(Value::number(0.25), Destination::Descriptor).value(), "0.25");
}

TEST(Serialize, ColorByteOrderDependsOnDestination)
{
    const Value c = Value::color(color::Color::rgb(1, 2, 3));
    EXPECT_EQ(serializeValue(c, Destination::Descriptor).value(), "66051");
    EXPECT_EQ(serializeValue(c, Destination::Config).value(), "197121");
}

TEST(Serialize, RejectsStructuredValues)
{
    support::SourceLoc loc{1, 4, 2};
    auto table = serializeValue(Value::opaque(Value::Kind::Table), Destination::Descriptor, loc);
    ASSERT_FALSE(table);
    EXPECT_EQ(table.error().code, diag::UnsupportedResult);
    EXPECT_EQ(table.error().loc.line, 4u);
    EXPECT_EQ(table.error().message.rfind("cannot serialize a table value", 0), 0u);
}
