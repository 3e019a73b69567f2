#include <gtest/gtest.h>
#include "../routing.h"
#include <qb/json.h>

using namespace qb::gate;

// --- Converters ---

TEST(ConverterTest, IntegerAcceptsSignedDecimal) {
    const Converter &conv = converters::integer();
    EXPECT_EQ(conv.name(), "int");

    auto v = conv("42");
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->get<long long>(), 42);

    v = conv("-7");
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->get<long long>(), -7);

    v = conv("+3");
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->get<long long>(), 3);
}

TEST(ConverterTest, IntegerRejectsPartialOrInvalidInput) {
    const Converter &conv = converters::integer();
    EXPECT_FALSE(conv("").has_value());
    EXPECT_FALSE(conv("abc").has_value());
    EXPECT_FALSE(conv("42abc").has_value());
    EXPECT_FALSE(conv("4.2").has_value());
    EXPECT_FALSE(conv(" 42").has_value());
    EXPECT_FALSE(conv("-").has_value());
    EXPECT_FALSE(conv("99999999999999999999999").has_value());
}

TEST(ConverterTest, NumberParsesWholeSegment) {
    const Converter &conv = converters::number();
    EXPECT_EQ(conv.name(), "float");

    auto v = conv("3.5");
    ASSERT_TRUE(v.has_value());
    EXPECT_DOUBLE_EQ(v->get<double>(), 3.5);

    v = conv("-2");
    ASSERT_TRUE(v.has_value());
    EXPECT_DOUBLE_EQ(v->get<double>(), -2.0);

    EXPECT_FALSE(conv("").has_value());
    EXPECT_FALSE(conv("3.5x").has_value());
    EXPECT_FALSE(conv(" 3.5").has_value());
    EXPECT_FALSE(conv("nan").has_value());
    EXPECT_FALSE(conv("inf").has_value());
    EXPECT_FALSE(conv("0x10").has_value());
    EXPECT_FALSE(conv("0x1p3").has_value());
    EXPECT_FALSE(conv("1e400").has_value());
    EXPECT_FALSE(conv("+-1").has_value());

    v = conv("+1.25e2");
    ASSERT_TRUE(v.has_value());
    EXPECT_DOUBLE_EQ(v->get<double>(), 125.0);
}

TEST(ConverterTest, StringAcceptsAnything) {
    const Converter &conv = converters::string();
    EXPECT_EQ(conv.name(), "str");

    auto v = conv("joe");
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->get<std::string>(), "joe");

    v = conv("");
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->get<std::string>(), "");
}

TEST(ConverterTest, UserDefinedConverter) {
    Converter upper("upper", [](std::string_view s) -> std::optional<qb::json> {
        for (char c : s) {
            if (c < 'A' || c > 'Z') {
                return std::nullopt;
            }
        }
        return qb::json(std::string(s));
    });

    EXPECT_EQ(upper.name(), "upper");
    EXPECT_TRUE(upper("ABC").has_value());
    EXPECT_FALSE(upper("AbC").has_value());
}

TEST(ConverterTest, EmptyParseFunctionIsRejected) {
    EXPECT_THROW(Converter("broken", nullptr), std::invalid_argument);
}

// --- PathPattern construction ---

TEST(PathPatternTest, AdjacentLiteralsAreConcatenated) {
    PathPattern pattern{"/api", "/v1", "/items"};
    ASSERT_EQ(pattern.segments().size(), 1u);
    EXPECT_EQ(pattern.segments()[0].literal(), "/api/v1/items");
    EXPECT_EQ(pattern.converter_count(), 0u);
}

TEST(PathPatternTest, MustStartWithLiteral) {
    EXPECT_THROW((PathPattern{converters::integer(), "/x"}), std::invalid_argument);
    EXPECT_NO_THROW((PathPattern{"", converters::integer(), "/x"}));
}

TEST(PathPatternTest, AdjacentConvertersAreRejected) {
    EXPECT_THROW((PathPattern{"/", converters::integer(), converters::string()}), std::invalid_argument);
    EXPECT_THROW((PathPattern{"/", converters::integer(), "", converters::string()}), std::invalid_argument);
}

TEST(PathPatternTest, PrintableForm) {
    PathPattern pattern{"/id/", converters::integer(), "/name/", converters::string()};
    EXPECT_EQ(pattern.str(), "/id/<int>/name/<str>");
    EXPECT_EQ(pattern.converter_count(), 2u);
    EXPECT_EQ(PathPattern().str(), "");
}

// --- PathPattern matching ---

TEST(PathPatternTest, ExtractsTypedValues) {
    PathPattern pattern{"/id/", converters::integer(), "/name/", converters::string()};

    auto args = pattern.match("/id/42/name/joe");
    ASSERT_TRUE(args.has_value());
    ASSERT_EQ(args->size(), 2u);
    EXPECT_EQ(args->at(0), qb::json(42));
    EXPECT_EQ(args->at(1), qb::json("joe"));
    EXPECT_EQ(args->get<long long>(0), 42);
    EXPECT_EQ(args->get<std::string>(1), "joe");
    EXPECT_EQ(args->values(), (PathArguments::Storage{qb::json(42), qb::json("joe")}));
}

TEST(PathPatternTest, RejectsUnparsableSegment) {
    PathPattern pattern{"/id/", converters::integer(), "/name/", converters::string()};
    EXPECT_FALSE(pattern.match("/id/abc/name/joe").has_value());
}

TEST(PathPatternTest, LastStringConverterTakesRemainder) {
    PathPattern pattern{"/id/", converters::integer(), "/name/", converters::string()};
    auto args = pattern.match("/id/42/name/joe/extra");
    ASSERT_TRUE(args.has_value());
    EXPECT_EQ(args->at(1), qb::json("joe/extra"));
}

TEST(PathPatternTest, RejectsTrailingInput) {
    PathPattern pattern{"/id/", converters::integer(), "/name"};
    EXPECT_TRUE(pattern.match("/id/42/name").has_value());
    EXPECT_FALSE(pattern.match("/id/42/name/joe/extra").has_value());
    EXPECT_FALSE(pattern.match("/id/42/names").has_value());
}

TEST(PathPatternTest, LiteralOnlyPattern) {
    PathPattern pattern{"/create"};
    auto args = pattern.match("/create");
    ASSERT_TRUE(args.has_value());
    EXPECT_TRUE(args->empty());

    EXPECT_FALSE(pattern.match("/create/").has_value());
    EXPECT_FALSE(pattern.match("/creat").has_value());
    EXPECT_FALSE(pattern.match("").has_value());
}

TEST(PathPatternTest, EmptyPatternMatchesOnlyEmptyPath) {
    PathPattern pattern;
    EXPECT_TRUE(pattern.match("").has_value());
    EXPECT_FALSE(pattern.match("/").has_value());
}

TEST(PathPatternTest, BoundaryIsFirstOccurrenceOfNextLiteral) {
    PathPattern pattern{"/", converters::string(), "/options"};

    auto args = pattern.match("/abc/options");
    ASSERT_TRUE(args.has_value());
    EXPECT_EQ(args->at(0), qb::json("abc"));

    // The captured value cannot contain the delimiter: the split happens at its first occurrence.
    EXPECT_FALSE(pattern.match("/a/options/options").has_value());
}

TEST(PathPatternTest, OutParameterUntouchedOnFailure) {
    PathPattern pattern{"/id/", converters::integer()};
    PathArguments out;
    out.push_back(qb::json("previous"));

    EXPECT_FALSE(pattern.match("/id/x", out));
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out.at(0), qb::json("previous"));

    EXPECT_TRUE(pattern.match("/id/9", out));
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out.at(0), qb::json(9));
}

TEST(PathPatternTest, FloatConverterInsidePath) {
    PathPattern pattern{"/price/", converters::number(), "/eur"};
    auto args = pattern.match("/price/12.5/eur");
    ASSERT_TRUE(args.has_value());
    EXPECT_DOUBLE_EQ(args->at(0).get<double>(), 12.5);
    EXPECT_FALSE(pattern.match("/price/cheap/eur").has_value());
}

TEST(PathArgumentsTest, AccessOutOfRangeThrows) {
    PathArguments args;
    args.push_back(qb::json(1));
    EXPECT_THROW((void) args.at(1), std::out_of_range);
    EXPECT_FALSE(args.get<int>(3).has_value());
    EXPECT_FALSE(args.get<std::string>(0).has_value());
}
