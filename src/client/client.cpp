/*
 * Part of the dmart-cpp project.
 *
 * SPDX-FileCopyrightText: 2025 dmart-cpp contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of dmart-cpp. See LICENSE for details.
 */

#include "dmart/client.hpp"
#include "dmart/auth_state.hpp"
#include "dmart/dispatcher.hpp"
#include "dmart/log.hpp"
#include "dmart/multipart.hpp"
#include "dmart/session_pool.hpp"

#include "dmart/internal/utils.hpp"

#include <mutex>
#include <stdexcept>
#include <utility>

namespace {

using nlohmann::json;

std::string seg(const std::string& s) {
    return dmart::internal::percent_encode(s, false);
}

std::string subpath_seg(const std::string& s) {
    return dmart::internal::percent_encode(s, true);
}

dmart::DmartException connection_error(int status, std::string message) {
    dmart::Error e;
    e.type = "connection";
    e.code = 0;
    e.message = std::move(message);
    return dmart::DmartException(dmart::ErrorKind::Connection, status, std::move(e));
}

} // namespace

namespace dmart {

struct Client::Impl {
    mutable std::mutex cfg_mtx;
    ClientConfig cfg;

    AuthState auth;
    Dispatcher dispatcher;

    Impl(const ClientConfig& c, std::shared_ptr<HttpTransport> transport)
        : cfg(c),
          dispatcher(transport ? std::move(transport) : SessionPool::acquire(), auth) {
        if (!cfg.log_file.empty()) dmart::set_log_file(cfg.log_file);
        dmart::set_log_stdout(cfg.log_stdout);
        if (!cfg.url.empty() && !dispatcher.set_base_url(cfg.url)) {
            dmart::log_line("[AUTH] invalid backend URL: " + cfg.url);
        }
    }

    Response manage(const std::string& space_name,
                    RequestType type,
                    Record record) {
        ActionRequest action;
        action.space_name = space_name;
        action.request_type = type;
        action.records.push_back(std::move(record));
        return post_action(action);
    }

    Response post_action(const ActionRequest& action) {
        ApiCall call;
        call.method = RequestMethod::Post;
        call.endpoint = "/managed/request";
        call.json = nlohmann::json(action);
        return dispatcher.call(call);
    }
};

Client::Client(const ClientConfig& cfg, std::shared_ptr<HttpTransport> transport)
    : _p(std::make_unique<Client::Impl>(cfg, std::move(transport))) {}

Client::~Client() = default;

void Client::connect() {
    std::string url, username, password;
    {
        std::lock_guard<std::mutex> lk(_p->cfg_mtx);
        url = _p->cfg.url;
        username = _p->cfg.username;
        password = _p->cfg.password;
    }

    // No partial state: whatever happens below, only a complete login stores a token.
    _p->auth.clear();

    if (!_p->dispatcher.set_base_url(url)) {
        throw connection_error(0, "invalid backend URL: '" + url + "'");
    }
    if (username.empty() || password.empty()) {
        throw connection_error(0, "username and password are required");
    }

    ApiCall call;
    call.method = RequestMethod::Post;
    call.endpoint = "/user/login";
    call.json = json{{"shortname", username}, {"password", password}};
    call.auth = Auth::None;

    Response resp;
    try {
        resp = _p->dispatcher.call(call);
    } catch (const DmartException& ex) {
        dmart::log_line(std::string("[AUTH] login failed: ") + ex.what());
        throw DmartException(ErrorKind::Connection, ex.status_code(), ex.error());
    }

    if (resp.status == Status::Failed || resp.records.empty()) {
        dmart::log_line("[AUTH] login refused for " + username);
        if (resp.error) throw DmartException(ErrorKind::Connection, 200, *resp.error);
        throw connection_error(200, "Failed to connect to the Dmart instance, invalid url or credentials");
    }

    const json& attrs = resp.records.front().attributes();
    auto it = attrs.find("access_token");
    if (it == attrs.end() || !it->is_string() || it->get<std::string>().empty()) {
        throw connection_error(200, "login response carries no access token");
    }

    _p->auth.set(it->get<std::string>());
    dmart::log_line("[AUTH] connected as " + username);
}

void Client::connect(const std::string& url, const std::string& username, const std::string& password) {
    {
        std::lock_guard<std::mutex> lk(_p->cfg_mtx);
        _p->cfg.url = url;
        _p->cfg.username = username;
        _p->cfg.password = password;
    }
    connect();
}

void Client::disconnect() {
    if (!_p->auth.present()) {
        Error e;
        e.type = "login";
        e.code = 10;
        e.message = "Not authenticated Dmart user";
        throw DmartException(ErrorKind::Unauthenticated, 401, std::move(e));
    }

    ApiCall call;
    call.method = RequestMethod::Post;
    call.endpoint = "/user/logout";
    try {
        _p->dispatcher.call(call);
    } catch (const DmartException& ex) {
        // The backend answered, so the session is gone either way.
        if (ex.kind() != ErrorKind::Unauthenticated && ex.status_code() != 0) {
            _p->auth.clear();
        }
        throw;
    }
    _p->auth.clear();
    dmart::log_line("[AUTH] disconnected");
}

bool Client::is_connected() const {
    return _p->auth.present();
}

Response Client::get_profile() {
    ApiCall call;
    call.method = RequestMethod::Get;
    call.endpoint = "/user/profile";
    return _p->dispatcher.call(call);
}

Response Client::create(const std::string& space_name,
                        const std::string& subpath,
                        const nlohmann::json& attributes,
                        const std::string& shortname,
                        ResourceType resource_type) {
    return _p->manage(space_name, RequestType::Create,
                      Record(resource_type, shortname, subpath, attributes));
}

Response Client::update(const std::string& space_name,
                        const std::string& subpath,
                        const std::string& shortname,
                        const nlohmann::json& attributes,
                        ResourceType resource_type) {
    return _p->manage(space_name, RequestType::Update,
                      Record(resource_type, shortname, subpath, attributes));
}

Response Client::delete_entry(const std::string& space_name,
                              const std::string& subpath,
                              const std::string& shortname,
                              ResourceType resource_type) {
    return _p->manage(space_name, RequestType::Delete,
                      Record(resource_type, shortname, subpath));
}

Response Client::request(const ActionRequest& action) {
    return _p->post_action(action);
}

Response Client::read(const std::string& space_name,
                      const std::string& subpath,
                      const std::string& shortname,
                      bool retrieve_attachments,
                      ResourceType resource_type) {
    ApiCall call;
    call.method = RequestMethod::Get;
    call.endpoint = "/managed/entry/" + seg(to_string(resource_type)) + "/" + seg(space_name) +
                    "/" + subpath_seg(subpath) + "/" + seg(shortname);
    call.query = {
        {"retrieve_json_payload", "true"},
        {"retrieve_attachments", retrieve_attachments ? "true" : "false"},
    };
    return _p->dispatcher.call(call);
}

nlohmann::json Client::read_json_payload(const std::string& space_name,
                                         const std::string& subpath,
                                         const std::string& shortname) {
    ApiCall call;
    call.method = RequestMethod::Get;
    call.endpoint = "/managed/payload/content/" + seg(space_name) + "/" + subpath_seg(subpath) +
                    "/" + seg(shortname) + ".json";
    return _p->dispatcher.send(call);
}

Response Client::query(const std::string& space_name,
                       const std::string& subpath,
                       const std::string& search,
                       const std::vector<std::string>& filter_schema_names,
                       const nlohmann::json& extra) {
    json body = {
        {"type", "search"},
        {"space_name", space_name},
        {"subpath", subpath},
        {"retrieve_json_payload", true},
        {"filter_schema_names", filter_schema_names},
        {"search", search},
    };
    if (!extra.is_null() && !extra.is_object()) {
        throw std::invalid_argument("query extra parameters must be a JSON object");
    }
    if (extra.is_object()) body.update(extra);

    ApiCall call;
    call.method = RequestMethod::Post;
    call.endpoint = "/managed/query";
    call.json = std::move(body);
    return _p->dispatcher.call(call);
}

Response Client::query(const QueryRequest& q) {
    ApiCall call;
    call.method = RequestMethod::Post;
    call.endpoint = "/managed/query";
    call.json = nlohmann::json(q);
    return _p->dispatcher.call(call);
}

Response Client::query_data_asset(const std::string& space_name,
                                  const std::string& subpath,
                                  const std::string& shortname,
                                  const std::string& data_asset_type,
                                  const std::string& query_string,
                                  const std::optional<std::string>& schema_shortname,
                                  ResourceType resource_type) {
    ApiCall call;
    call.method = RequestMethod::Post;
    call.endpoint = "/managed/data-asset";
    call.json = json{
        {"space_name", space_name},
        {"subpath", subpath},
        {"resource_type", to_string(resource_type)},
        {"shortname", shortname},
        {"schema_shortname", schema_shortname ? json(*schema_shortname) : json(nullptr)},
        {"data_asset_type", data_asset_type},
        {"query_string", query_string},
    };
    return _p->dispatcher.call(call);
}

Response Client::progress_ticket(const std::string& space_name,
                                 const std::string& subpath,
                                 const std::string& shortname,
                                 const std::string& action,
                                 const std::optional<std::string>& cancellation_reasons) {
    ApiCall call;
    call.method = RequestMethod::Put;
    call.endpoint = "/managed/progress-ticket/" + seg(space_name) + "/" + subpath_seg(subpath) +
                    "/" + seg(shortname) + "/" + seg(action);
    if (cancellation_reasons && !cancellation_reasons->empty()) {
        call.json = json{{"resolution", *cancellation_reasons}};
    }
    return _p->dispatcher.call(call);
}

Response Client::upload_resource_with_payload(const std::string& space_name,
                                              const Record& record,
                                              std::string payload,
                                              const std::string& payload_file_name,
                                              const std::string& payload_mime_type) {
    MultipartForm form;
    form.add_file("request_record", "record.json", "application/json", json(record).dump());
    form.add_file("payload_file", payload_file_name, payload_mime_type, std::move(payload));
    form.add_field("space_name", space_name);

    ApiCall call;
    call.method = RequestMethod::Post;
    call.endpoint = "/managed/resource_with_payload";
    call.form = std::move(form);
    return _p->dispatcher.call(call);
}

} // namespace dmart
