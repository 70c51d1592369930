//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: mock_server_main.cpp
// Purpose: Scriptable stdio MCP server used by the bridge tests
//==========================================================================================================
//
// Flags (all --key or --key=value):
//   --tools=a,b         advertised tool names (default: echo,sleep,crash,fail,fake_timeout,noise,env,pid)
//   --page-size=N       split tools/list into pages of N tools using nextCursor
//   --hang-init         never answer initialize
//   --fail-init         answer initialize with a JSON-RPC error
//   --exit-on-init      exit(1) when initialize arrives
//   --fail-list         answer tools/list with a JSON-RPC error
//   --exit-after-init   exit(0) after notifications/initialized, before tools/list is answered
//   --stderr-lines=N    write N lines to stderr at startup
//   --notify            send notifications/message after notifications/initialized
//   --server-ping       send a ping request to the client after notifications/initialized
//   --ignore-sigterm    ignore SIGTERM and stdin EOF so only SIGKILL stops the process
//
// Tools:
//   echo {text}         -> text content with `text` (or the serialized arguments)
//   sleep {ms, text}    -> replies after ms on a separate thread (responses may be reordered)
//   crash               -> exit(3) without replying
//   fail                -> JSON-RPC error -32000 with data.reason
//   fake_timeout        -> JSON-RPC error -32001 produced by the server itself
//   noise               -> writes a malformed line and a reply for an unknown id before the real reply
//   env {name}          -> value of environment variable `name`
//   pid                 -> process id
//   close_output        -> closes stdout without replying, then exits(4) one second later (not advertised)

#include <signal.h>
#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "mcpbridge/JSONRPCTypes.h"

using namespace mcpbridge;

namespace {

struct MockOptions {
    std::vector<std::string> tools{"echo", "sleep", "crash", "fail", "fake_timeout", "noise", "env", "pid"};
    std::size_t pageSize{0};
    bool hangInit{false};
    bool failInit{false};
    bool exitOnInit{false};
    bool failList{false};
    bool exitAfterInit{false};
    int stderrLines{0};
    bool notify{false};
    bool serverPing{false};
    bool ignoreSigterm{false};
};

std::mutex outMutex;

void writeLine(const std::string& line) {
    std::lock_guard<std::mutex> lock(outMutex);
    std::cout << line << '\n' << std::flush;
}

void writeMessage(const JSONValue& v) {
    writeLine(serializeJSONValue(v));
}

JSONValue obj(std::initializer_list<std::pair<const std::string, JSONValue>> members) {
    JSONValue::Object o;
    for (const auto& m : members) {
        o[m.first] = std::make_shared<JSONValue>(m.second);
    }
    return JSONValue(std::move(o));
}

void reply(const JSONValue& id, const JSONValue& result) {
    writeMessage(obj({{"jsonrpc", JSONValue("2.0")}, {"id", id}, {"result", result}}));
}

void replyError(const JSONValue& id, int64_t code, const std::string& message,
                std::optional<JSONValue> data = std::nullopt) {
    JSONValue err = data.has_value()
        ? obj({{"code", JSONValue(code)}, {"message", JSONValue(message)}, {"data", data.value()}})
        : obj({{"code", JSONValue(code)}, {"message", JSONValue(message)}});
    writeMessage(obj({{"jsonrpc", JSONValue("2.0")}, {"id", id}, {"error", err}}));
}

JSONValue textContent(const std::string& text) {
    JSONValue::Array content;
    content.push_back(std::make_shared<JSONValue>(obj({{"type", JSONValue("text")}, {"text", JSONValue(text)}})));
    return obj({{"content", JSONValue(std::move(content))}, {"isError", JSONValue(false)}});
}

std::vector<std::string> splitComma(const std::string& s) {
    std::vector<std::string> out;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) {
            out.push_back(item);
        }
    }
    return out;
}

MockOptions parseOptions(int argc, char** argv) {
    MockOptions o;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        std::string key = a;
        std::string value;
        if (auto eq = a.find('='); eq != std::string::npos) {
            key = a.substr(0, eq);
            value = a.substr(eq + 1);
        }
        if (key == "--tools") o.tools = splitComma(value);
        else if (key == "--page-size") o.pageSize = static_cast<std::size_t>(std::stoul(value));
        else if (key == "--hang-init") o.hangInit = true;
        else if (key == "--fail-init") o.failInit = true;
        else if (key == "--exit-on-init") o.exitOnInit = true;
        else if (key == "--fail-list") o.failList = true;
        else if (key == "--exit-after-init") o.exitAfterInit = true;
        else if (key == "--stderr-lines") o.stderrLines = std::stoi(value);
        else if (key == "--notify") o.notify = true;
        else if (key == "--server-ping") o.serverPing = true;
        else if (key == "--ignore-sigterm") o.ignoreSigterm = true;
        else {
            std::cerr << "mock: unknown flag " << a << std::endl;
            std::exit(64);
        }
    }
    return o;
}

std::string stringArg(const JSONValue& args, const std::string& key) {
    return getStringMember(args, key).value_or("");
}

int64_t intArg(const JSONValue& args, const std::string& key) {
    const JSONValue* v = findMember(args, key);
    if (v != nullptr && std::holds_alternative<int64_t>(v->value)) {
        return std::get<int64_t>(v->value);
    }
    return 0;
}

JSONValue toolsPage(const MockOptions& o, std::size_t start) {
    JSONValue::Array tools;
    const std::size_t end = o.pageSize == 0 ? o.tools.size() : std::min(o.tools.size(), start + o.pageSize);
    for (std::size_t i = start; i < end; ++i) {
        JSONValue schema = obj({{"type", JSONValue("object")}});
        tools.push_back(std::make_shared<JSONValue>(obj({{"name", JSONValue(o.tools[i])},
                                                         {"description", JSONValue("mock tool " + o.tools[i])},
                                                         {"inputSchema", schema}})));
    }
    if (end < o.tools.size()) {
        return obj({{"tools", JSONValue(std::move(tools))}, {"nextCursor", JSONValue(std::to_string(end))}});
    }
    return obj({{"tools", JSONValue(std::move(tools))}});
}

void callTool(const JSONValue& id, const std::string& name, const JSONValue& args) {
    if (name == "echo") {
        auto text = getStringMember(args, "text");
        reply(id, textContent(text.has_value() ? *text : serializeJSONValue(args)));
    } else if (name == "sleep") {
        const int64_t ms = intArg(args, "ms");
        const std::string text = stringArg(args, "text");
        std::thread([id, ms, text]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(ms));
            reply(id, textContent(text));
        }).detach();
    } else if (name == "crash") {
        std::cerr << "mock: crashing on request" << std::endl;
        std::_Exit(3);
    } else if (name == "fail") {
        replyError(id, -32000, "tool failed", obj({{"reason", JSONValue("requested")}}));
    } else if (name == "fake_timeout") {
        replyError(id, -32001, "server-side timeout");
    } else if (name == "noise") {
        writeLine("this is not json");
        writeMessage(obj({{"jsonrpc", JSONValue("2.0")}, {"id", JSONValue("unknown-id")}, {"result", obj({})}}));
        reply(id, textContent("after noise"));
    } else if (name == "env") {
        const char* v = std::getenv(stringArg(args, "name").c_str());
        reply(id, textContent(v ? v : ""));
    } else if (name == "close_output") {
        {
            std::lock_guard<std::mutex> lock(outMutex);
            std::cout.flush();
            ::close(STDOUT_FILENO);
        }
        std::thread([]() {
            std::this_thread::sleep_for(std::chrono::seconds(1));
            std::_Exit(4);
        }).detach();
    } else if (name == "pid") {
        reply(id, textContent(std::to_string(static_cast<long>(::getpid()))));
    } else {
        replyError(id, -32602, "unknown tool " + name);
    }
}

} // namespace

int main(int argc, char** argv) {
    const MockOptions opts = parseOptions(argc, argv);
    if (opts.ignoreSigterm) {
        ::signal(SIGTERM, SIG_IGN);
    }
    for (int i = 0; i < opts.stderrLines; ++i) {
        std::cerr << "mock stderr line " << i << std::endl;
    }

    std::string line;
    while (std::getline(std::cin, line)) {
        if (line.empty()) {
            continue;
        }
        JSONValue msg;
        try {
            msg = parseJSON(line);
        } catch (const std::exception& e) {
            std::cerr << "mock: bad input: " << e.what() << std::endl;
            continue;
        }
        const auto method = getStringMember(msg, "method");
        const JSONValue* id = findMember(msg, "id");
        const JSONValue* params = findMember(msg, "params");
        const JSONValue noParams = obj({});

        if (!method.has_value()) {
            // Reply to one of our own requests
            if (id != nullptr) {
                std::cerr << "mock: got reply for " << serializeJSONValue(*id) << std::endl;
            }
            continue;
        }
        if (id == nullptr && method->rfind("notifications/", 0) != 0) {
            continue;
        }
        if (*method == "initialize") {
            if (opts.exitOnInit) {
                std::cerr << "mock: exiting during initialize" << std::endl;
                std::_Exit(1);
            }
            if (opts.hangInit) {
                continue;
            }
            if (opts.failInit) {
                replyError(*id, -32603, "initialize rejected");
                continue;
            }
            reply(*id, obj({{"protocolVersion", JSONValue("2025-06-18")},
                            {"capabilities", obj({{"tools", obj({})}})},
                            {"serverInfo", obj({{"name", JSONValue("mock-server")}, {"version", JSONValue("1.2.3")}})}}));
        } else if (*method == "notifications/initialized") {
            if (opts.exitAfterInit) {
                std::cerr << "mock: exiting after initialized" << std::endl;
                std::_Exit(0);
            }
            if (opts.notify) {
                writeMessage(obj({{"jsonrpc", JSONValue("2.0")}, {"method", JSONValue("notifications/message")},
                                  {"params", obj({{"level", JSONValue("warning")}, {"data", JSONValue("mock ready")}})}}));
            }
            if (opts.serverPing) {
                writeMessage(obj({{"jsonrpc", JSONValue("2.0")}, {"id", JSONValue("srv-1")}, {"method", JSONValue("ping")}}));
            }
        } else if (*method == "tools/list") {
            if (opts.failList) {
                replyError(*id, -32603, "listing failed");
                continue;
            }
            std::size_t start = 0;
            if (params != nullptr) {
                if (auto cursor = getStringMember(*params, "cursor")) {
                    start = static_cast<std::size_t>(std::stoul(*cursor));
                }
            }
            reply(*id, toolsPage(opts, start));
        } else if (*method == "tools/call") {
            const JSONValue& p = params != nullptr ? *params : noParams;
            const JSONValue* args = findMember(p, "arguments");
            callTool(*id, stringArg(p, "name"), args != nullptr ? *args : noParams);
        } else if (*method == "ping") {
            reply(*id, obj({}));
        } else if (id != nullptr) {
            replyError(*id, -32601, "Method not found: " + *method);
        }
    }
    if (opts.ignoreSigterm) {
        // Outlive stdin EOF too, so only SIGKILL ends the process
        for (;;) {
            ::pause();
        }
    }
    return 0;
}
