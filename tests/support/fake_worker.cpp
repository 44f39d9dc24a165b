/// Scriptable worker for the integration tests. Reads one request per line on
/// stdin and answers on stdout without a "jsonrpc" member, the way real
/// workers commonly do.
///
///   echo     result = params
///   sleep    reply {"slept": ms} after params.ms, on its own thread
///   never    no reply
///   exit     exit immediately with params.code (default 3), no reply
///   garbage  write a non-JSON line, then reply {"ok": true}
///   stderr   write params.text to stderr, then reply {"ok": true}
///   fail     error reply with params.code (default -32603) and a traceback
///   orphan   reply to an id nobody asked for, then reply {"ok": true}
///   pid      reply {"pid": getpid()}
///   linger   start a `sleep` grandchild that keeps stdout open, then exit
///            with params.code (default 9), no reply
///   ask      send params.count requests to the bridge, then reply {"asked": n}

#include <nlohmann/json.hpp>
#include <unistd.h>
#include <chrono>
#include <cstdio>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>

namespace {

std::mutex out_mutex;

void write_line(const std::string& line) {
    std::lock_guard<std::mutex> lock(out_mutex);
    std::cout << line << '\n' << std::flush;
}

void reply(const nlohmann::json& id, nlohmann::json result) {
    write_line(nlohmann::json{{"id", id}, {"result", std::move(result)}}.dump());
}

void reply_error(const nlohmann::json& id, int code, const std::string& message,
                 nlohmann::json data = nullptr) {
    nlohmann::json err = {{"code", code}, {"message", message}};
    if (!data.is_null()) err["data"] = std::move(data);
    write_line(nlohmann::json{{"id", id}, {"error", std::move(err)}}.dump());
}

void handle(const nlohmann::json& req) {
    const nlohmann::json id = req.value("id", nlohmann::json());
    const std::string method = req.value("method", std::string());
    const nlohmann::json params = req.value("params", nlohmann::json::object());

    if (method == "echo") {
        reply(id, params);
    } else if (method == "sleep") {
        int ms = params.value("ms", 0);
        std::thread([id, ms] {
            std::this_thread::sleep_for(std::chrono::milliseconds(ms));
            reply(id, nlohmann::json{{"slept", ms}});
        }).detach();
    } else if (method == "never") {
        // deliberately silent
    } else if (method == "exit") {
        std::cout.flush();
        ::_exit(params.value("code", 3));
    } else if (method == "garbage") {
        write_line("this is not json {");
        reply(id, nlohmann::json{{"ok", true}});
    } else if (method == "stderr") {
        std::cerr << params.value("text", std::string("diagnostic")) << std::endl;
        reply(id, nlohmann::json{{"ok", true}});
    } else if (method == "fail") {
        reply_error(id, params.value("code", -32603), params.value("message", std::string("boom")),
                    nlohmann::json{{"traceback", "Traceback (most recent call last):\n  fake"}});
    } else if (method == "orphan") {
        reply(999999, nlohmann::json{{"stray", true}});
        reply(id, nlohmann::json{{"ok", true}});
    } else if (method == "linger") {
        std::cout.flush();
        if (::fork() == 0) {
            ::execlp("sleep", "sleep", "3", static_cast<char*>(nullptr));
            ::_exit(127);
        }
        ::_exit(params.value("code", 9));
    } else if (method == "ask") {
        int count = params.value("count", 1);
        for (int i = 0; i < count; ++i) {
            write_line(nlohmann::json{{"id", "ask-" + std::to_string(i)},
                                      {"method", "sampling/createMessage"},
                                      {"params", {{"n", i}}}}.dump());
        }
        reply(id, nlohmann::json{{"asked", count}});
    } else if (method == "pid") {
        reply(id, nlohmann::json{{"pid", static_cast<int>(::getpid())}});
    } else {
        reply_error(id, -32601, "Method not found: " + method);
    }
}

} // namespace

int main() {
    std::ios::sync_with_stdio(false);
    std::string line;
    while (std::getline(std::cin, line)) {
        if (line.empty()) continue;
        nlohmann::json req = nlohmann::json::parse(line, nullptr, false);
        if (req.is_discarded() || !req.is_object()) {
            reply_error(nullptr, -32700, "Parse error");
            continue;
        }
        if (!req.contains("method")) continue; // the bridge answering an "ask"
        handle(req);
    }
    // Detached sleepers may still be running; leave without static teardown.
    std::cout.flush();
    ::_exit(0);
}
