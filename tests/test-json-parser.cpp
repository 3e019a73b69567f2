#include <gtest/gtest.h>
#include "../validation.h"
#include "../error.h"
#include <qb/json.h>

using namespace qb::gate;
using namespace qb::gate::validation;

namespace {

// Serves the parsed body back; records that it ran.
struct EchoHandler {
    int *calls;

    Response operator()(Context &ctx) const {
        ++*calls;
        const qb::json *body = ctx.get_ptr<qb::json>(JsonParser::JSON_BODY_KEY);
        return Response(Status::OK).json(body ? *body : qb::json());
    }
};

int status_of(const JsonParser &parser, Request request) {
    Context ctx(std::move(request));
    try {
        (void) parser(ctx);
    } catch (const HttpError &e) {
        return e.status().code();
    }
    return 200;
}

} // namespace

class JsonParserTest : public ::testing::Test {
protected:
    int calls = 0;
    FilterPtr item = filter::object({
        filter::required("id", filter::integer(0)),
        filter::optional("description", filter::string()),
    });
};

TEST_F(JsonParserTest, ParsesAndStoresBody) {
    JsonParser parser(EchoHandler{&calls});
    Context ctx(Request::with_body("POST", "/items", "application/json", R"({"id":1})"));

    Response res = parser(ctx);
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(res.body, R"({"id":1})");
    EXPECT_EQ(res.header("Content-Type"), "application/json");

    auto raw = ctx.get<std::string>(JsonParser::RAW_BODY_KEY);
    ASSERT_TRUE(raw.has_value());
    EXPECT_EQ(*raw, R"({"id":1})");
    EXPECT_TRUE(ctx.request().body_consumed());
}

TEST_F(JsonParserTest, AcceptsStructuredSyntaxSuffix) {
    JsonParser parser(EchoHandler{&calls});
    EXPECT_EQ(status_of(parser, Request::with_body("POST", "/", "application/vnd.api+json", "[]")), 200);
    EXPECT_EQ(calls, 1);
}

TEST_F(JsonParserTest, MissingContentTypeIsBodyRequired) {
    JsonParser parser(EchoHandler{&calls});
    Context ctx(Request("POST", "/items"));
    try {
        (void) parser(ctx);
        FAIL() << "expected HttpError";
    } catch (const HttpError &e) {
        EXPECT_EQ(e.status().code(), 400);
        EXPECT_EQ(e.message(), "Body required");
    }
    EXPECT_EQ(calls, 0);
}

TEST_F(JsonParserTest, NonJsonContentTypeIsUnsupported) {
    JsonParser parser(EchoHandler{&calls});
    Context ctx(Request::with_body("POST", "/items", "application/xml", "<id>1</id>"));
    try {
        (void) parser(ctx);
        FAIL() << "expected HttpError";
    } catch (const HttpError &e) {
        EXPECT_EQ(e.status().code(), 415);
        EXPECT_EQ(e.message(), "Only json content is allowed.");
    }
    EXPECT_FALSE(ctx.request().body_consumed());
}

TEST_F(JsonParserTest, MalformedBodyIsUnprocessable) {
    JsonParser parser(EchoHandler{&calls});
    Context ctx(Request::with_body("POST", "/items", "application/json", "{\"id\":"));
    try {
        (void) parser(ctx);
        FAIL() << "expected HttpError";
    } catch (const HttpError &e) {
        EXPECT_EQ(e.status().code(), 422);
        EXPECT_EQ(e.message(), "Invalid JSON");
    }
    EXPECT_EQ(calls, 0);
}

TEST_F(JsonParserTest, EmptyBodyIsUnprocessable) {
    JsonParser parser(EchoHandler{&calls});
    EXPECT_EQ(status_of(parser, Request("POST", "/items", std::string("application/json"))), 422);
}

TEST_F(JsonParserTest, FilterRejectionCarriesReason) {
    JsonParser parser(EchoHandler{&calls}, item);
    Context ctx(Request::with_body("POST", "/items", "application/json", R"({"id":5,"extra":1})"));
    try {
        (void) parser(ctx);
        FAIL() << "expected HttpError";
    } catch (const HttpError &e) {
        EXPECT_EQ(e.status().code(), 400);
        EXPECT_EQ(e.message(), "unsupported key 'extra'");
    }
    EXPECT_EQ(calls, 0);
    EXPECT_FALSE(ctx.has(JsonParser::JSON_BODY_KEY));
}

TEST_F(JsonParserTest, FilterAcceptanceForwards) {
    JsonParser parser(EchoHandler{&calls}, item);
    EXPECT_EQ(status_of(parser, Request::with_body("POST", "/items", "application/json",
                                                   R"({"id":5,"description":"five"})")),
              200);
    EXPECT_EQ(calls, 1);
}

TEST_F(JsonParserTest, DeclaredLengthOverLimitIsRefused) {
    JsonParser parser(EchoHandler{&calls}, nullptr, JsonParser::Options().max_body_size(8));
    Context ctx(Request::with_body("POST", "/items", "application/json", R"({"id":123456})"));
    try {
        (void) parser(ctx);
        FAIL() << "expected HttpError";
    } catch (const HttpError &e) {
        EXPECT_EQ(e.status().code(), 413);
    }
    EXPECT_FALSE(ctx.request().body_consumed());
}

TEST_F(JsonParserTest, ZeroLimitDisablesCheck) {
    JsonParser parser(EchoHandler{&calls}, nullptr, JsonParser::Options().max_body_size(0));
    EXPECT_EQ(status_of(parser, Request::with_body("POST", "/", "application/json", R"({"id":123456})")), 200);
}

TEST_F(JsonParserTest, BodyIsReadUpToDeclaredLength) {
    JsonParser parser(EchoHandler{&calls});
    auto source = std::make_shared<StringBodySource>("[1,2]trailing-garbage");
    Context ctx(Request("POST", "/", std::string("application/json"), 5, source));
    Response res = parser(ctx);
    EXPECT_EQ(res.body, "[1,2]");
}

TEST_F(JsonParserTest, CustomMediaTypeToken) {
    EXPECT_THROW(JsonParser::Options().media_type_token("application/json"), std::invalid_argument);
    EXPECT_THROW(JsonParser::Options().media_type_token(""), std::invalid_argument);

    JsonParser geo(EchoHandler{&calls}, nullptr, JsonParser::Options().media_type_token("geojson"));
    EXPECT_EQ(status_of(geo, Request::with_body("POST", "/", "application/geojson", "{}")), 200);
    EXPECT_EQ(status_of(geo, Request::with_body("POST", "/", "application/json", "{}")), 415);
}

TEST_F(JsonParserTest, RejectsEmptyNextHandler) {
    EXPECT_THROW((void) JsonParser(Handler()), std::invalid_argument);
}

// --- Standalone pipeline ---

TEST(JsonPipelineTest, ParseAndValidate) {
    auto f = filter::array(filter::integer());
    qb::json value = parse_and_validate("[1, 2]", f);
    EXPECT_EQ(value, qb::json::parse("[1,2]"));

    try {
        (void) parse_and_validate(R"([1, 2, "x"])", f);
        FAIL() << "expected HttpError";
    } catch (const HttpError &e) {
        EXPECT_EQ(e.status().code(), 400);
        EXPECT_EQ(e.message(), "2: expected int, found \"x\" of type string");
    }

    EXPECT_THROW((void) parse_and_validate("not json"), HttpError);
    EXPECT_NO_THROW(validate(nullptr, qb::json("anything")));
}
