#include "mcp/mcp_stdio.hpp"
#include "protocol/json_rpc.hpp"
#include "utils/debug_log.hpp"

#include <cerrno>
#include <cstring>
#include <iostream>
#include <signal.h>

// Framing uses brace-counting with string/escape awareness,
// so it works both with newline-delimited and streamed JSON.
// A message that does not start with '{' (a scalar, a batch array, garbage)
// is taken up to the end of its line and handed on whole, so it gets an
// error response instead of being skipped.

namespace mcp_stdio {

using json = nlohmann::json;

std::string read_message(std::istream &input) {
    std::string buffer;
    int brace_depth = 0;
    bool inside_string = false;
    bool escape_next = false;

    char character;
    while (input.get(character)) {
        if (brace_depth == 0) {
            if (character == ' ' || character == '\t' || character == '\r' || character == '\n') {
                continue;
            }
            if (character == '{') {
                brace_depth = 1;
                buffer += character;
                continue;
            }
            buffer += character;
            std::string rest_of_line;
            std::getline(input, rest_of_line);
            buffer += rest_of_line;
            while (!buffer.empty() && (buffer.back() == '\r' || buffer.back() == ' ' ||
                                       buffer.back() == '\t')) {
                buffer.pop_back();
            }
            return buffer;
        }

        buffer += character;

        if (escape_next) {
            escape_next = false;
        } else if (inside_string) {
            if (character == '\\') {
                escape_next = true;
            } else if (character == '"') {
                inside_string = false;
            }
        } else if (character == '"') {
            inside_string = true;
        } else if (character == '{') {
            brace_depth++;
        } else if (character == '}') {
            brace_depth--;
            if (brace_depth == 0) {
                return buffer;
            }
        }
    }

    // EOF reached without a complete message.
    if (!buffer.empty()) {
        debug_log::log("Discarding incomplete message at EOF (" + std::to_string(buffer.size()) + " bytes)");
    }
    return "";
}

void write_message(std::ostream &output, const std::string &json_string) {
    output << json_string << "\n";
    output.flush();
}

void log_message(const std::string &message) {
    std::cerr << "[dotmcps] " << message << std::endl;
}

bool install_signal_handlers(void (*handler)(int)) {
    struct sigaction action;
    std::memset(&action, 0, sizeof(action));
    action.sa_handler = handler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0; // no SA_RESTART: read(2) on stdin must return EINTR

    for (int signal_number : {SIGINT, SIGTERM}) {
        if (sigaction(signal_number, &action, nullptr) != 0) {
            log_message("sigaction failed: " + std::string(strerror(errno)));
            return false;
        }
    }
    return true;
}

int serve(std::istream &input, std::ostream &output, const mcp_dispatch::Dispatcher &dispatcher,
          const volatile std::sig_atomic_t *shutdown_requested) {
    int handled_count = 0;

    while (shutdown_requested == nullptr || *shutdown_requested == 0) {
        std::string raw_message = read_message(input);
        if (raw_message.empty()) {
            // EOF on stdin means the client disconnected.
            log_message("EOF on stdin. Shutting down.");
            break;
        }
        handled_count++;

        json parsed_message;
        try {
            parsed_message = json::parse(raw_message);
        } catch (const json::parse_error &error) {
            log_message("Failed to parse incoming JSON: " + std::string(error.what()));
            write_message(output, json_rpc::build_parse_error_response(error.what()).dump());
            continue;
        }

        json response = dispatcher.dispatch_message(parsed_message);

        // Notifications return null (no response needed).
        if (response.is_null()) {
            continue;
        }

        std::string serialized;
        try {
            serialized = response.dump();
        } catch (const json::type_error &error) {
            log_message("Failed to serialize response: " + std::string(error.what()));
            serialized = json_rpc::build_error_response(json_rpc::get_id(parsed_message),
                                                        json_rpc::INTERNAL_ERROR,
                                                        "Internal error").dump();
        }
        write_message(output, serialized);
    }

    return handled_count;
}

} // namespace mcp_stdio
