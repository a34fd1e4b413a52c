// Authbridge Pipeline Unit Tests

#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "../../src/gateway/pipeline.hpp"

using namespace authbridge;
using namespace authbridge::gateway;
using namespace authbridge::http;

namespace {

std::string drain(Body& body) {
    std::string out;
    REQUIRE(read_all(body, out) == ReadAllStatus::Complete);
    return out;
}

/// Records its name and returns a fixed result (Stop sets a 400 carrying the name)
class RecordingMiddleware : public Middleware {
public:
    RecordingMiddleware(std::vector<std::string>& calls, std::string name, MiddlewareResult result)
        : calls_(calls), name_(std::move(name)), result_(result) {}

    MiddlewareResult process_request(RequestContext& ctx) override {
        calls_.push_back(name_);
        if (result_ == MiddlewareResult::Stop) {
            ctx.set_error(make_text_response(StatusCode::BadRequest, name_));
        }
        return result_;
    }

    std::string_view name() const override { return name_; }

private:
    std::vector<std::string>& calls_;
    std::string name_;
    MiddlewareResult result_;
};

}  // namespace

TEST_CASE("Pipeline - Execution order", "[pipeline]") {
    Pipeline pipeline;
    std::vector<std::string> calls;

    pipeline.use(std::make_unique<RecordingMiddleware>(calls, "first", MiddlewareResult::Continue));
    pipeline.use(std::make_unique<RecordingMiddleware>(calls, "second", MiddlewareResult::Stop));
    pipeline.use(std::make_unique<RecordingMiddleware>(calls, "third", MiddlewareResult::Continue));

    RequestContext ctx;
    REQUIRE(pipeline.execute_request(ctx) == MiddlewareResult::Stop);
    REQUIRE(calls == std::vector<std::string>{"first", "second"});
    REQUIRE(ctx.error_response->body == "second");
    REQUIRE(pipeline.size() == 3);
}

TEST_CASE("Pipeline - Error without a response becomes 500", "[pipeline]") {
    Pipeline pipeline;
    std::vector<std::string> calls;
    pipeline.use(std::make_unique<RecordingMiddleware>(calls, "broken", MiddlewareResult::Error));

    RequestContext ctx;
    REQUIRE(pipeline.execute_request(ctx) == MiddlewareResult::Error);
    REQUIRE(ctx.has_error());
    REQUIRE(ctx.error_response->status == StatusCode::InternalServerError);
}

TEST_CASE("Pipeline - Missing request is an internal error", "[pipeline]") {
    control::Config config;
    Pipeline pipeline = build_auth_pipeline(config);

    RequestContext ctx;
    REQUIRE(pipeline.execute_request(ctx) == MiddlewareResult::Error);
    REQUIRE(ctx.error_response->status == StatusCode::InternalServerError);
}

TEST_CASE("Auth pipeline - End to end rewrite", "[pipeline][auth]") {
    control::Config config;
    Pipeline pipeline = build_auth_pipeline(config);
    REQUIRE(pipeline.size() == 2);

    Request request;
    request.method = "POST";
    request.uri = "/api/v3/post";
    request.path = "/api/v3/post";

    SECTION("JSON body token becomes a bearer header") {
        std::string json = R"({"name":"hello","auth":"jwt.token.value"})";
        request.headers = {{"Host", "localhost"}, {"Content-Type", "application/json"}};

        RequestContext ctx;
        ctx.request = &request;
        ctx.body = std::make_unique<BufferedBody>(json);

        REQUIRE(pipeline.execute_request(ctx) == MiddlewareResult::Continue);
        REQUIRE(ctx.token_source == TokenSource::JsonBody);
        REQUIRE(ctx.outgoing_headers.size() == 3);
        REQUIRE(ctx.outgoing_headers.back() == Header{"Authorization", "Bearer jwt.token.value"});
        REQUIRE(drain(*ctx.body) == json);
    }

    SECTION("query token is used; query string itself is untouched") {
        request.uri = "/api/v3/post?auth=q&sort=New";
        request.query = "auth=q&sort=New";

        RequestContext ctx;
        ctx.request = &request;
        ctx.body = std::make_unique<BufferedBody>();

        REQUIRE(pipeline.execute_request(ctx) == MiddlewareResult::Continue);
        REQUIRE(ctx.token_source == TokenSource::Query);
        REQUIRE(ctx.outgoing_headers.back() == Header{"Authorization", "Bearer q"});
        REQUIRE(request.query == "auth=q&sort=New");
    }

    SECTION("existing header: headers forwarded as-is") {
        request.uri = "/api/v3/post?auth=q";
        request.query = "auth=q";
        request.headers = {{"authorization", "Bearer mine"}};

        RequestContext ctx;
        ctx.request = &request;
        ctx.body = std::make_unique<BufferedBody>();

        REQUIRE(pipeline.execute_request(ctx) == MiddlewareResult::Continue);
        REQUIRE(ctx.token_source == TokenSource::None);
        REQUIRE(ctx.outgoing_headers == request.headers);
    }

    SECTION("injection attempt stops the pipeline") {
        request.uri = "/api/v3/post?auth=a%0D%0AX-Evil:%201";
        request.query = "auth=a%0D%0AX-Evil:%201";

        RequestContext ctx;
        ctx.request = &request;
        ctx.body = std::make_unique<BufferedBody>();

        REQUIRE(pipeline.execute_request(ctx) == MiddlewareResult::Stop);
        REQUIRE(ctx.error_response->status == StatusCode::BadRequest);
    }
}
