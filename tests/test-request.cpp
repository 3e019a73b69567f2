#include <gtest/gtest.h>
#include "../request.h"
#include "../response.h"
#include "../error.h"
#include "../routing/context.h"

using namespace qb::gate;

namespace {

// Counts reads so that tests can check the source is consumed once.
class CountingSource : public IBodySource {
public:
    int reads = 0;
    std::string data;

    explicit CountingSource(std::string d) : data(std::move(d)) {}

    std::string read(std::size_t max_bytes) override {
        ++reads;
        return data.substr(0, max_bytes);
    }
};

} // namespace

TEST(RequestTest, DescriptorFields) {
    Request req("PATCH", "/items/3?verbose=1", std::string("application/json"), 2);
    EXPECT_EQ(req.method(), "PATCH");
    EXPECT_EQ(req.path(), "/items/3");
    ASSERT_TRUE(req.content_type().has_value());
    EXPECT_EQ(*req.content_type(), "application/json");
    EXPECT_EQ(req.content_length(), 2u);
    EXPECT_EQ(req.header("content-type"), "application/json");
    EXPECT_EQ(req.header("CONTENT-LENGTH"), "2");
}

TEST(RequestTest, PathIsPercentDecoded) {
    Request req("GET", "/files/annual%20report?x=1");
    EXPECT_EQ(req.path(), "/files/annual report");
    EXPECT_EQ(std::string(req.uri().path()), "/files/annual%20report");
}

TEST(RequestTest, HeadersAreCaseInsensitive) {
    Request req("GET", "/");
    req.set_header("X-Trace-Id", "abc");
    EXPECT_EQ(req.header("x-trace-id"), "abc");
    req.set_header("x-trace-id", "def");
    EXPECT_EQ(req.header("X-TRACE-ID"), "def");
    EXPECT_FALSE(req.header("Authorization").has_value());
}

TEST(RequestTest, BodyIsReadOnceAndCached) {
    auto source = std::make_shared<CountingSource>("hello world");
    Request req("POST", "/", std::string("text/plain"), 5, source);

    EXPECT_FALSE(req.body_consumed());
    EXPECT_EQ(req.read_body(), "hello");
    EXPECT_EQ(req.read_body(), "hello");
    EXPECT_TRUE(req.body_consumed());
    EXPECT_EQ(source->reads, 1);
}

TEST(RequestTest, NoDeclaredLengthMeansEmptyBody) {
    auto source = std::make_shared<CountingSource>("ignored");
    Request req("POST", "/", std::string("text/plain"), 0, source);
    EXPECT_EQ(req.read_body(), "");
    EXPECT_EQ(source->reads, 0);
}

TEST(RequestTest, WithBodySetsLength) {
    Request req = Request::with_body("PUT", "/doc", "application/json", "{}");
    EXPECT_EQ(req.content_length(), 2u);
    EXPECT_EQ(req.read_body(), "{}");
}

TEST(ResponseTest, JsonAndTextHelpers) {
    Response res;
    EXPECT_EQ(res.status.code(), 200);

    res.json(qb::json{{"a", 1}});
    EXPECT_EQ(res.body, R"({"a":1})");
    EXPECT_EQ(res.header("content-type"), "application/json");

    res.text("plain");
    EXPECT_EQ(res.body, "plain");
    EXPECT_EQ(res.header("Content-Type"), "text/plain; charset=utf-8");
}

TEST(StatusTest, ReasonPhrases) {
    EXPECT_EQ(Status(Status::NOT_FOUND).str(), "404 Not Found");
    EXPECT_EQ(Status(Status::UNPROCESSABLE_ENTITY).code(), 422);
    EXPECT_EQ(std::to_string(Status(Status::METHOD_NOT_ALLOWED)), "405 Method Not Allowed");
}

TEST(HttpErrorTest, CarriesStatusMessageAndHeaders) {
    HttpError e = error::unauthorized("nope", {{"WWW-Authenticate", "Basic realm=\"x\""}});
    EXPECT_EQ(e.status().code(), 401);
    EXPECT_EQ(e.message(), "nope");
    EXPECT_EQ(e.header("www-authenticate"), "Basic realm=\"x\"");
    EXPECT_STREQ(e.what(), "401 Unauthorized: nope");

    HttpError too_large = error::payload_too_large(1024);
    EXPECT_EQ(too_large.status().code(), 413);
    EXPECT_EQ(error::malformed_body().status().code(), 422);
    EXPECT_EQ(error::shape_validation_failed("r").message(), "r");
}

TEST(ContextTest, CustomDataStore) {
    Context ctx(Request("GET", "/"));
    EXPECT_FALSE(ctx.has("user"));
    ctx.set("user", std::string("joe"));
    EXPECT_TRUE(ctx.has("user"));
    EXPECT_EQ(ctx.get<std::string>("user"), "joe");
    EXPECT_FALSE(ctx.get<int>("user").has_value());
    EXPECT_EQ(ctx.get_ptr<int>("user"), nullptr);
    EXPECT_TRUE(ctx.remove("user"));
    EXPECT_FALSE(ctx.remove("user"));
}
