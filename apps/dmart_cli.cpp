// SPDX-License-Identifier: Apache-2.0
// Part of dmart-cpp project.
// apps/dmart_cli.cpp

#include "cli_args.hpp"

#include "dmart/client.hpp"
#include "dmart/session_pool.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

static void usage(const char* argv0){
    std::cerr <<
      "Usage:\n"
      "  " << argv0 << " --url https://host[:port] --user NAME --password PASS "
      "[--tls_ca ca.crt] [--insecure 0|1] [--log FILE] [--quiet 0|1] COMMAND [ARGS]\n"
      "\n"
      "Commands:\n"
      "  profile\n"
      "  read     SPACE SUBPATH SHORTNAME [RESOURCE_TYPE] [--attachments]\n"
      "  payload  SPACE SUBPATH SHORTNAME\n"
      "  query    SPACE SUBPATH [SEARCH]\n"
      "  create   SPACE SUBPATH SHORTNAME ATTRIBUTES_JSON [RESOURCE_TYPE]\n"
      "  update   SPACE SUBPATH SHORTNAME ATTRIBUTES_JSON [RESOURCE_TYPE]\n"
      "  delete   SPACE SUBPATH SHORTNAME [RESOURCE_TYPE]\n"
      "  progress SPACE SUBPATH SHORTNAME ACTION [RESOLUTION]\n"
      "  upload   SPACE RECORD_JSON FILE MIME_TYPE\n"
      "\n"
      "Timeouts:\n"
      "  --connect_timeout <sec>   TCP connect + TLS handshake timeout (default 5)\n"
      "  --io_timeout <sec>        per-op I/O timeout (default 30)\n";
}

static bool read_file(const std::string& path, std::string& out){
    std::ifstream ifs(path, std::ios::in | std::ios::binary);
    if (!ifs) return false;
    out.assign(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
    return true;
}

static dmart::ResourceType type_arg(const std::vector<std::string>& a, std::size_t i){
    return i < a.size() ? dmart::resource_type_from_string(a[i]) : dmart::ResourceType::Content;
}

static nlohmann::json envelope(const dmart::Response& r){
    return nlohmann::json(r);
}

int main(int argc, char** argv){
    CliArgs parsed;
    if (!parse_cli_args(argc, argv, parsed)) {
        usage(argv[0]);
        return 2;
    }
    const dmart::ClientConfig& cfg = parsed.cfg;
    const std::vector<std::string>& args = parsed.args;
    const bool attachments = parsed.attachments;

    const std::string cmd = args[0];
    auto need = [&](std::size_t n){ return args.size() >= n + 1; };

    try {
        dmart::Client cli(cfg, dmart::SessionPool::acquire(parsed.pool));
        cli.connect();

        nlohmann::json out;
        if (cmd=="profile") {
            out = envelope(cli.get_profile());
        } else if (cmd=="read" && need(3)) {
            out = envelope(cli.read(args[1], args[2], args[3], attachments, type_arg(args, 4)));
        } else if (cmd=="payload" && need(3)) {
            out = cli.read_json_payload(args[1], args[2], args[3]);
        } else if (cmd=="query" && need(2)) {
            out = envelope(cli.query(args[1], args[2], args.size() > 3 ? args[3] : ""));
        } else if (cmd=="create" && need(4)) {
            out = envelope(cli.create(args[1], args[2], nlohmann::json::parse(args[4]),
                                      args[3], type_arg(args, 5)));
        } else if (cmd=="update" && need(4)) {
            out = envelope(cli.update(args[1], args[2], args[3], nlohmann::json::parse(args[4]),
                                      type_arg(args, 5)));
        } else if (cmd=="delete" && need(3)) {
            out = envelope(cli.delete_entry(args[1], args[2], args[3], type_arg(args, 4)));
        } else if (cmd=="progress" && need(4)) {
            std::optional<std::string> resolution;
            if (args.size() > 5) resolution = args[5];
            out = envelope(cli.progress_ticket(args[1], args[2], args[3], args[4], resolution));
        } else if (cmd=="upload" && need(4)) {
            std::string payload;
            if (!read_file(args[3], payload)) {
                std::cerr << "cannot read " << args[3] << "\n";
                return 2;
            }
            const auto record = nlohmann::json::parse(args[2]).get<dmart::Record>();
            const std::string name = args[3].substr(args[3].find_last_of('/') + 1);
            out = envelope(cli.upload_resource_with_payload(args[1], record, std::move(payload),
                                                            name, args[4]));
        } else {
            usage(argv[0]);
            return 2;
        }

        std::cout << out.dump(2) << "\n";
        cli.disconnect();
    } catch (const dmart::DmartException& ex) {
        std::cerr << ex.what() << "\n";
        return 1;
    } catch (const nlohmann::json::exception& ex) {
        std::cerr << "bad JSON argument: " << ex.what() << "\n";
        return 2;
    } catch (const std::invalid_argument& ex) {
        std::cerr << ex.what() << "\n";
        return 2;
    }
    return 0;
}
