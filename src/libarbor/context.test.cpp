#include "test.hpp"

using namespace std::literals;

namespace {
    auto post(std::string content_type, std::string body) -> arbor::request {
        return arbor::request {
            .method = "POST",
            .target = "/submit",
            .headers = {{"Content-Type", std::move(content_type)}},
            .body = std::move(body)
        };
    }
}

TEST(Context, JsonBody) {
    const auto req = post("application/json", R"({"name":"ada","age":36})");
    const auto ctx = arbor::context(req);

    EXPECT_EQ("ada"sv, ctx.body["name"].get<std::string>());
    EXPECT_EQ(36, ctx.body["age"].get<int>());
    EXPECT_FALSE(ctx.body_error());
}

TEST(Context, JsonBodyWithCharset) {
    const auto req = post("application/json; charset=utf-8", "[1,2,3]");
    const auto ctx = arbor::context(req);

    EXPECT_EQ(arbor::json({1, 2, 3}), ctx.body);
}

TEST(Context, MalformedJsonBody) {
    const auto req = post("application/json", "{not json");
    const auto ctx = arbor::context(req);

    EXPECT_TRUE(ctx.body.is_null());
    EXPECT_TRUE(ctx.body_error());
}

TEST(Context, TextBody) {
    const auto req = post("text/plain", "hello there");
    const auto ctx = arbor::context(req);

    EXPECT_EQ("hello there"sv, ctx.body.get<std::string>());
}

TEST(Context, FormBody) {
    const auto req = post(
        "application/x-www-form-urlencoded",
        "name=Ada+Lovelace&lang=en&lang=fr"
    );
    const auto ctx = arbor::context(req);

    EXPECT_EQ("Ada Lovelace"sv, ctx.body["name"].get<std::string>());
    EXPECT_EQ("fr"sv, ctx.body["lang"].get<std::string>());
}

TEST(Context, UnknownContentTypeIsNotParsed) {
    const auto req = post("application/octet-stream", "\x01\x02");
    const auto ctx = arbor::context(req);

    EXPECT_TRUE(ctx.body.is_null());
    EXPECT_FALSE(ctx.body_error());
    EXPECT_EQ("\x01\x02"sv, ctx.request().body);
}

TEST(Context, InvalidContentTypeIsNotParsed) {
    const auto req = post("nonsense", "{}");
    const auto ctx = arbor::context(req);

    EXPECT_TRUE(ctx.body.is_null());
    EXPECT_FALSE(ctx.body_error());
}

TEST(Context, GetAndHeadBodiesAreIgnored) {
    for (const auto* const method : {"GET", "head"}) {
        auto req = post("application/json", R"({"a":1})");
        req.method = method;

        const auto ctx = arbor::context(req);

        EXPECT_TRUE(ctx.body.is_null()) << method;
    }
}

TEST(Context, Query) {
    const auto req = arbor::request {
        .target = "/search?q=c%2B%2B&page=2&q=rust&empty"
    };
    const auto ctx = arbor::context(req);

    EXPECT_EQ("rust"sv, ctx.query["q"].get<std::string>());
    EXPECT_EQ(2, ctx.query_param<int>("page"));
    EXPECT_EQ(""sv, ctx.query["empty"].get<std::string>());
    EXPECT_FALSE(ctx.query_param<std::optional<int>>("missing"));
    EXPECT_FALSE(ctx.query_param<std::optional<int>>("empty"));
}

TEST(Context, Headers) {
    const auto req = arbor::request {
        .headers = {{"X-Request-ID", "abc"}, {"Content-Length", "12"}}
    };
    const auto ctx = arbor::context(req);

    EXPECT_EQ("abc"sv, ctx.headers["x-request-id"].get<std::string>());
    EXPECT_EQ("abc"sv, ctx.header("X-Request-Id"));
    EXPECT_EQ(12, ctx.header<int>("content-length"));
    EXPECT_EQ("abc"sv, ctx.request().header("x-request-id"));
}

TEST(Context, Cookies) {
    const auto req = arbor::request {
        .headers = {{"Cookie", "session=abc=123; theme=dark;broken; =x"}}
    };
    const auto ctx = arbor::context(req);

    EXPECT_EQ(
        arbor::json({{"session", "abc=123"}, {"theme", "dark"}}),
        ctx.cookies
    );
}

TEST(Context, TypedParams) {
    const auto req = arbor::request();
    auto ctx = arbor::context(req);

    ctx.params = {{"id", "42"}, {"slug", "hello"}};

    EXPECT_EQ(42, ctx.param<int>("id"));
    EXPECT_EQ("hello"sv, ctx.param("slug"));
}

TEST(Context, TypedParamsAfterCoercion) {
    const auto req = arbor::request();
    auto ctx = arbor::context(req);

    ctx.params = {{"id", 42}};

    EXPECT_EQ(42, ctx.param<int>("id"));
}

TEST(Context, MissingParamIsBadRequest) {
    const auto req = arbor::request();
    const auto ctx = arbor::context(req);

    try {
        ctx.param<int>("id");
        FAIL() << "expected an exception";
    }
    catch (const arbor::http_exception& ex) {
        EXPECT_EQ(400, ex.status());
        EXPECT_EQ("Missing required path parameter 'id'"sv, ex.what());
    }
}

TEST(Context, MalformedParamIsBadRequest) {
    const auto req = arbor::request();
    auto ctx = arbor::context(req);

    ctx.params = {{"id", "abc"}};

    EXPECT_THROW(ctx.param<int>("id"), arbor::http_exception);
}

TEST(Context, State) {
    const auto req = arbor::request();
    auto ctx = arbor::context(req);

    EXPECT_FALSE(ctx.has("user"));

    ctx.set("user", std::string("ada"));

    EXPECT_TRUE(ctx.has("user"));
    EXPECT_EQ("ada"s, ctx.get<std::string>("user"));
    EXPECT_THROW(ctx.get<int>("user"), std::invalid_argument);
    EXPECT_THROW(ctx.get<int>("missing"), std::out_of_range);
}

TEST(Context, JsonResponder) {
    const auto req = arbor::request();
    auto ctx = arbor::context(req);

    const auto res = ctx.json({{"ok", true}}, 201);

    EXPECT_EQ(201, res.status);
    EXPECT_EQ(R"({"ok":true})"sv, res.body);
    EXPECT_EQ("application/json; charset=utf-8"sv, res.content_type());
    ASSERT_TRUE(ctx.res);
    EXPECT_EQ(res.body, ctx.res->body);
}

TEST(Context, JsonResponderKeepsContentType) {
    const auto req = arbor::request();
    auto ctx = arbor::context(req);

    const auto res = ctx.json(
        {{"id", 1}},
        arbor::response_init {
            .status = 200,
            .headers = {{"Content-Type", "application/vnd.api+json"}}
        }
    );

    EXPECT_EQ("application/vnd.api+json"sv, res.content_type());
    EXPECT_EQ(1u, res.headers.size());
}

TEST(Context, TextAndHtmlResponders) {
    const auto req = arbor::request();
    auto ctx = arbor::context(req);

    const auto text = ctx.text("plain");
    EXPECT_EQ(200, text.status);
    EXPECT_EQ("text/plain; charset=utf-8"sv, text.content_type());

    const auto html = ctx.html("<p>hi</p>", 202);
    EXPECT_EQ(202, html.status);
    EXPECT_EQ("text/html; charset=utf-8"sv, html.content_type());
    EXPECT_EQ("<p>hi</p>"sv, ctx.res->body);
}

TEST(Context, Redirect) {
    const auto req = arbor::request();
    auto ctx = arbor::context(req);

    const auto res = ctx.redirect("/login");

    EXPECT_EQ(302, res.status);
    EXPECT_EQ("/login"sv, res.header("Location"));
    EXPECT_TRUE(res.body.empty());
}
