#include <doctest/doctest.h>
#include "trustchain/tool_call_gateway.hpp"
#include "test_support.hpp"

#include <deque>

using namespace trustchain;
using namespace trustchain::testing;
using json = nlohmann::json;
using namespace std::chrono;

namespace {

/// Replays queued responses and keeps every request it was handed
class ScriptedTransport : public ToolTransport {
public:
    std::deque<json> responses;
    std::vector<json> requests;

    json send(const ServerConfig&, const json& request) override {
        requests.push_back(request);
        if (responses.empty()) {
            throw IoError("no scripted response");
        }
        json next = responses.front();
        responses.pop_front();
        return next;
    }
};

json rpcResult(const json& result) {
    return json{{"jsonrpc", "2.0"}, {"id", 1}, {"result", result}};
}

TrustRecord trusted(const std::string& id) {
    TrustRecord r;
    r.server_id = id;
    r.issuer = "registry.example";
    r.valid_from = Clock::now() - hours(1);
    r.valid_to = Clock::now() + hours(1);
    r.trust_tier = ServerTrustTier::Trusted;
    r.source = TrustSource::Registry;
    return r;
}

struct GatewayFixture {
    std::unique_ptr<Session> session = Session::create(TrustChainConfig{});
    TrustRegistry registry;
    std::shared_ptr<ScriptedTransport> transport = std::make_shared<ScriptedTransport>();

    ServerConfig remote{"tasks", "https://tasks.example.com/mcp"};
    ServerConfig panel{"panel", "http://localhost:3001/mcp"};

    explicit GatewayFixture(PolicyOptions options = {}) : policy(registry, options) {
        registry.upsert(trusted("tasks"));
    }

    ToolCallGateway gateway() { return ToolCallGateway(*session, policy, transport); }

    PolicyEvaluator policy;
};

}  // namespace

TEST_CASE("Gateway signs and dispatches trusted calls") {
    GatewayFixture f;
    auto gateway = f.gateway();
    f.transport->responses.push_back(rpcResult({{"tasks", json::array({"a", "b"})}}));

    json args = {{"limit", 2}};
    auto result = gateway.call(f.remote, "list_tasks", args);
    CHECK(result["tasks"].size() == 2);

    REQUIRE(f.transport->requests.size() == 1);
    const auto& request = f.transport->requests[0];
    CHECK(request["jsonrpc"] == "2.0");
    CHECK(request["method"] == "tools/call");
    CHECK(request["params"]["name"] == "list_tasks");
    CHECK(request["params"]["arguments"] == args);
    CHECK(request["id"] == 1);

    REQUIRE(request.contains("trustchain"));
    auto envelope = request["trustchain"].get<Envelope>();
    CHECK(envelope.sequence == 1);
    CHECK(f.session->verify(envelope, "list_tasks", args));
    CHECK(f.session->sessionInfo().total_calls == 1);
}

TEST_CASE("Gateway request ids increase") {
    GatewayFixture f;
    auto gateway = f.gateway();
    f.transport->responses.push_back(rpcResult(json::object()));
    f.transport->responses.push_back(rpcResult(json::object()));

    gateway.call(f.remote, "get_task", {{"id", 1}});
    gateway.call(f.remote, "get_task", {{"id", 2}});
    CHECK(f.transport->requests[0]["id"] == 1);
    CHECK(f.transport->requests[1]["id"] == 2);
    CHECK(f.transport->requests[1]["trustchain"]["sequence"] == 2);
}

TEST_CASE("Gateway returns the whole response when there is no result") {
    GatewayFixture f;
    auto gateway = f.gateway();
    f.transport->responses.push_back(json{{"items", 4}});
    CHECK(gateway.call(f.remote, "count_items", json::object()) == json{{"items", 4}});
}

TEST_CASE("Gateway blocks untrusted servers before signing") {
    GatewayFixture f;
    auto gateway = f.gateway();
    ServerConfig unknown{"mystery", "https://mystery.example.net"};

    try {
        gateway.call(unknown, "list_tasks", json::object());
        FAIL("expected a denial");
    } catch (const UntrustedServerError& e) {
        CHECK(e.denyCode() == deny_codes::SERVER_UNTRUSTED);
    }
    CHECK(f.transport->requests.empty());
    CHECK(f.session->sessionInfo().sequence == 0);
}

TEST_CASE("Gateway surfaces policy denials in results") {
    GatewayFixture f;
    auto gateway = f.gateway();
    json verdict = {{"action", "deny"},
                    {"code", "POLICY_BLOCKED"},
                    {"reason", "outside change window"}};
    f.transport->responses.push_back(
        rpcResult({{"content", json::array({{{"type", "text"}, {"text", verdict.dump()}}})}}));

    try {
        gateway.call(f.remote, "list_tasks", json::object());
        FAIL("expected a denial");
    } catch (const PolicyDeniedError& e) {
        CHECK(e.denyCode() == "POLICY_BLOCKED");
        CHECK(e.reason() == "outside change window");
        CHECK(e.errorCode() == TcErrorCode::POLICY_DENIED);
    }
    CHECK(f.transport->requests.size() == 1);
}

TEST_CASE("Gateway retries read-only loopback calls unsigned") {
    PolicyOptions options;
    options.unsigned_read_fallback = true;
    options.local_bootstrap = true;
    GatewayFixture f(options);
    auto gateway = f.gateway();

    f.transport->responses.push_back(json{
        {"jsonrpc", "2.0"},
        {"id", 1},
        {"error",
         {{"code", -32001}, {"message", "bad signature"}, {"data", {{"code", "SIGNATURE_INVALID"}}}}}});
    f.transport->responses.push_back(rpcResult({{"items", json::array({1})}}));

    auto result = gateway.call(f.panel, "list_tasks", json::object());
    CHECK(result["items"].size() == 1);
    CHECK(result["trustchain_fallback_unsigned"] == true);
    CHECK(result["trustchain_fallback_reason"] == "SIGNATURE_INVALID: bad signature");

    REQUIRE(f.transport->requests.size() == 2);
    CHECK(f.transport->requests[0].contains("trustchain"));
    CHECK_FALSE(f.transport->requests[1].contains("trustchain"));
    CHECK(f.transport->requests[1]["params"]["name"] == "list_tasks");
}

TEST_CASE("Gateway does not retry remote servers") {
    PolicyOptions options;
    options.unsigned_read_fallback = true;
    GatewayFixture f(options);
    auto gateway = f.gateway();
    f.transport->responses.push_back(
        json{{"error", {{"code", "SIGNATURE_MISSING"}, {"message", "sign it"}}}});

    CHECK_THROWS_AS(gateway.call(f.remote, "list_tasks", json::object()), PolicyDeniedError);
    CHECK(f.transport->requests.size() == 1);
}

TEST_CASE("Gateway fails when the unsigned retry is denied too") {
    PolicyOptions options;
    options.unsigned_read_fallback = true;
    options.local_bootstrap = true;
    GatewayFixture f(options);
    auto gateway = f.gateway();
    f.transport->responses.push_back(json{{"error", {{"code", "SIGNATURE_MISSING"}}}});
    f.transport->responses.push_back(json{{"error", "unsigned calls disabled"}});

    try {
        gateway.call(f.panel, "list_tasks", json::object());
        FAIL("expected a denial");
    } catch (const PolicyDeniedError& e) {
        CHECK(e.denyCode() == deny_codes::POLICY_DENIED);
        CHECK(e.reason() == "unsigned calls disabled");
    }
    CHECK(f.transport->requests.size() == 2);
}

TEST_CASE("Gateway requires a transport") {
    GatewayFixture f;
    CHECK_THROWS_AS(ToolCallGateway(*f.session, f.policy, nullptr), ConfigurationError);
}

TEST_CASE("ResponseDenial") {
    CHECK_FALSE(responseDenial(rpcResult({{"ok", true}})).has_value());
    CHECK_FALSE(responseDenial(json{{"error", nullptr}, {"result", 1}}).has_value());

    auto numeric = responseDenial(json{{"error", {{"code", -32600}, {"message", "bad request"}}}});
    REQUIRE(numeric.has_value());
    CHECK(numeric->code == deny_codes::POLICY_DENIED);
    CHECK(numeric->message == "bad request");

    auto named = responseDenial(json{{"error", {{"code", "RATE_LIMITED"}, {"message", "slow"}}}});
    REQUIRE(named.has_value());
    CHECK(named->code == "RATE_LIMITED");

    auto bare = responseDenial(json{{"success", false}, {"reason", "nope"}});
    REQUIRE(bare.has_value());
    CHECK(bare->message == "nope");
}

TEST_CASE("HttpToolTransport") {
    auto http = std::make_shared<FakeHttpClient>();
    HttpToolTransport transport(http, milliseconds(3000));
    ServerConfig server{"tasks", "https://tasks.example.com/mcp"};
    json request = {{"jsonrpc", "2.0"}, {"id", 7}, {"method", "tools/call"}};

    SUBCASE("json response") {
        http->onPost = [](const RecordedRequest&, HttpError&) -> std::optional<HttpResponse> {
            return jsonResponse(200, {{"jsonrpc", "2.0"}, {"id", 7}, {"result", 1}});
        };
        auto response = transport.send(server, request);
        CHECK(response["result"] == 1);
        REQUIRE(http->requests.size() == 1);
        CHECK(http->requests[0].url == server.url);
        CHECK(http->requests[0].timeout == milliseconds(3000));
        CHECK(json::parse(http->requests[0].body) == request);
    }
    SUBCASE("error status with a text body") {
        http->onPost = [](const RecordedRequest&, HttpError&) -> std::optional<HttpResponse> {
            return HttpResponse{500, "upstream exploded"};
        };
        auto response = transport.send(server, request);
        CHECK(response["id"] == 7);
        CHECK(response["error"]["code"] == "HTTP_500");
        CHECK(response["error"]["message"] == "upstream exploded");
        CHECK(responseDenial(response)->code == "HTTP_500");
    }
    SUBCASE("redirects surface as errors") {
        http->onPost = [](const RecordedRequest&, HttpError&) -> std::optional<HttpResponse> {
            return HttpResponse{302, "moved"};
        };
        auto response = transport.send(server, request);
        CHECK(response["error"]["code"] == "HTTP_302");
        REQUIRE(http->requests.size() == 1);
        CHECK(http->requests[0].url == server.url);
    }
    SUBCASE("success status with a text body") {
        http->onPost = [](const RecordedRequest&, HttpError&) -> std::optional<HttpResponse> {
            return HttpResponse{200, "<html>"};
        };
        CHECK_THROWS_AS(transport.send(server, request), IoError);
    }
    SUBCASE("unreachable") {
        http->onPost = timeoutHandler();
        CHECK_THROWS_AS(transport.send(server, request), IoError);
    }
    CHECK_THROWS_AS(HttpToolTransport(nullptr, milliseconds(1)), ConfigurationError);
}
