/*
 * Part of the dmart-cpp project.
 *
 * SPDX-FileCopyrightText: 2025 dmart-cpp contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of dmart-cpp. See LICENSE for details.
 */

#include <catch2/catch.hpp>

#include "dmart/dispatcher.hpp"
#include "dmart/error.hpp"

#include "fakes/fake_transport.hpp"

#include <memory>
#include <stdexcept>
#include <string>

using namespace dmart;
using dmart::testing::FakeTransport;
using nlohmann::json;

namespace {

struct Fixture {
    std::shared_ptr<FakeTransport> net = std::make_shared<FakeTransport>();
    AuthState auth;
    Dispatcher disp{net, auth};

    Fixture() { REQUIRE(disp.set_base_url("http://localhost:8282/api/")); }
};

ApiCall get(const std::string& endpoint) {
    ApiCall c;
    c.method = RequestMethod::Get;
    c.endpoint = endpoint;
    return c;
}

} // namespace

TEST_CASE("dispatcher requires a transport", "[dispatcher]") {
    AuthState auth;
    CHECK_THROWS_AS(Dispatcher(nullptr, auth), std::invalid_argument);
}

TEST_CASE("base URL is kept on a bad update", "[dispatcher]") {
    Fixture f;
    CHECK_FALSE(f.disp.set_base_url("not a url"));
    CHECK(f.disp.has_base_url());
}

TEST_CASE("no token means no request", "[dispatcher]") {
    Fixture f;
    try {
        f.disp.call(get("/user/profile"));
        FAIL("expected DmartException");
    } catch (const DmartException& ex) {
        CHECK(ex.kind() == ErrorKind::Unauthenticated);
        CHECK(ex.status_code() == 401);
        CHECK(ex.error().type == "login");
        CHECK(ex.error().code == 10);
    }
    CHECK(f.net->request_count() == 0);
}

TEST_CASE("bearer request shape", "[dispatcher]") {
    Fixture f;
    f.auth.set("tok-9");
    f.net->queue_response(200, R"({"status":"success","records":[]})");

    ApiCall c = get("/managed/entry/content/news/posts/e1");
    c.query = {{"retrieve_json_payload", "true"}, {"retrieve_attachments", "false"}};
    const Response r = f.disp.call(c);
    CHECK(r.records.empty());

    const HttpRequest req = f.net->last_request();
    CHECK(req.method == "GET");
    CHECK_FALSE(req.tls);
    CHECK(req.host == "localhost");
    CHECK(req.port == 8282);
    CHECK(req.target ==
          "/api/managed/entry/content/news/posts/e1?retrieve_json_payload=true&retrieve_attachments=false");
    CHECK(req.headers.at("Authorization") == "Bearer tok-9");
    CHECK(req.headers.count("Content-Type") == 0);
    CHECK(req.body.empty());
}

TEST_CASE("content type follows the body", "[dispatcher]") {
    Fixture f;
    f.auth.set("tok");
    f.net->queue_response(200, R"({"status":"success"})");
    f.net->queue_response(200, R"({"status":"success"})");

    ApiCall js;
    js.method = RequestMethod::Post;
    js.endpoint = "/managed/query";
    js.json = json{{"space_name", "news"}};
    f.disp.call(js);
    CHECK(f.net->request(0).headers.at("Content-Type") == "application/json");
    CHECK(json::parse(f.net->request(0).body)["space_name"] == "news");

    ApiCall form;
    form.method = RequestMethod::Post;
    form.endpoint = "/managed/resource_with_payload";
    form.form = MultipartForm("B0undary");
    form.form->add_field("space_name", "news");
    f.disp.call(form);
    CHECK(f.net->request(1).headers.at("Content-Type") == "multipart/form-data; boundary=B0undary");
    CHECK(f.net->request(1).body.find("news") != std::string::npos);
}

TEST_CASE("login call carries no bearer", "[dispatcher]") {
    Fixture f;
    f.auth.set("stale");
    f.net->queue_response(200, dmart::testing::login_ok_body());

    ApiCall c;
    c.method = RequestMethod::Post;
    c.endpoint = "/user/login";
    c.json = json{{"shortname", "u"}, {"password", "p"}};
    c.auth = Auth::None;
    f.disp.call(c);
    CHECK(f.net->last_request().headers.count("Authorization") == 0);
}

TEST_CASE("backend rejection keeps the backend error", "[dispatcher]") {
    Fixture f;
    f.auth.set("tok");
    f.net->queue_response(422,
        R"({"status":"failed","error":{"type":"validation","code":12,"message":"bad shortname"}})");
    try {
        f.disp.call(get("/user/profile"));
        FAIL("expected DmartException");
    } catch (const DmartException& ex) {
        CHECK(ex.kind() == ErrorKind::BackendRejected);
        CHECK(ex.status_code() == 422);
        CHECK(ex.error().type == "validation");
        CHECK(ex.error().code == 12);
        CHECK(ex.error().message == "bad shortname");
    }
}

TEST_CASE("rejection without an error object", "[dispatcher]") {
    Fixture f;
    f.auth.set("tok");
    f.net->queue_response(500, R"({"detail":"boom"})");
    try {
        f.disp.call(get("/user/profile"));
        FAIL("expected DmartException");
    } catch (const DmartException& ex) {
        CHECK(ex.kind() == ErrorKind::BackendRejected);
        CHECK(ex.status_code() == 500);
        CHECK(ex.error().type == "http");
        CHECK(ex.error().code == 500);
    }
}

TEST_CASE("non-JSON bodies are transport failures", "[dispatcher]") {
    Fixture f;
    f.auth.set("tok");
    f.net->queue_response(502, "<html>Bad Gateway</html>");
    f.net->queue_response(200, "not json");

    try {
        f.disp.call(get("/user/profile"));
        FAIL("expected DmartException");
    } catch (const DmartException& ex) {
        CHECK(ex.kind() == ErrorKind::Transport);
        CHECK(ex.status_code() == 502);
    }
    try {
        f.disp.call(get("/user/profile"));
        FAIL("expected DmartException");
    } catch (const DmartException& ex) {
        CHECK(ex.kind() == ErrorKind::Transport);
        CHECK(ex.status_code() == 200);
    }
}

TEST_CASE("malformed envelope on 200", "[dispatcher]") {
    Fixture f;
    f.auth.set("tok");
    f.net->queue_response(200, R"({"status":"failed"})");
    f.net->queue_response(200, R"({"status":"success","records":{"resource_type":"content"}})");
    for (int i = 0; i < 2; ++i) {
        try {
            f.disp.call(get("/user/profile"));
            FAIL("expected DmartException");
        } catch (const DmartException& ex) {
            CHECK(ex.kind() == ErrorKind::Transport);
            CHECK(ex.status_code() == 200);
        }
    }
}

TEST_CASE("non-conforming records do not fail the call", "[dispatcher]") {
    Fixture f;
    f.auth.set("tok");
    f.net->queue_response(200, R"({"status":"success","records":[{"resource_type":"history",)"
                               R"("shortname":"2024-01-01T10:00","subpath":"posts","attributes":{}}]})");
    const Response r = f.disp.call(get("/managed/query"));
    CHECK(r.status == Status::Success);
    CHECK(r.records.empty());
    REQUIRE(r.raw_records.size() == 1);
    CHECK(r.raw_records[0]["shortname"] == "2024-01-01T10:00");
}

TEST_CASE("send returns raw JSON", "[dispatcher]") {
    Fixture f;
    f.auth.set("tok");
    f.net->queue_response(200, R"({"body":"hello","n":[1,2]})");
    const json j = f.disp.send(get("/managed/payload/content/news/posts/e1.json"));
    CHECK(j["body"] == "hello");
    CHECK(j["n"].size() == 2);
}

TEST_CASE("no response maps to status 0", "[dispatcher]") {
    Fixture f;
    f.auth.set("tok");
    f.net->queue_failure();
    try {
        f.disp.call(get("/user/profile"));
        FAIL("expected DmartException");
    } catch (const DmartException& ex) {
        CHECK(ex.kind() == ErrorKind::Transport);
        CHECK(ex.status_code() == 0);
    }
}
