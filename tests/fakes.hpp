/**
 * @file fakes.hpp
 * @brief Scripted CommandRunner and HttpTransport doubles for adapter tests
 *
 * @date 2025
 */

#pragma once

#include "dockhand/utils/http_transport.hpp"
#include "dockhand/utils/process_runner.hpp"

#include <deque>
#include <stdexcept>
#include <string>
#include <vector>

namespace dockhand {
namespace fakes {

/// Records every command line and replays queued results in order
class FakeCommandRunner : public utils::CommandRunner {
public:
    struct Call {
        std::vector<std::string> argv;
        std::string stdin_data;
    };

    void Push(int exit_code, std::string out = "", std::string err = "") {
        utils::CommandResult result;
        result.exit_code = exit_code;
        result.stdout_output = std::move(out);
        result.stderr_output = std::move(err);
        results_.push_back(result);
    }

    utils::CommandResult Run(const std::vector<std::string>& argv,
                             const std::string& stdin_data = "") override {
        calls.push_back({argv, stdin_data});
        if (results_.empty()) {
            return {};
        }
        auto result = results_.front();
        results_.pop_front();
        return result;
    }

    std::vector<Call> calls;

private:
    std::deque<utils::CommandResult> results_;
};

/// Records every request and replays queued responses in order
class FakeHttpTransport : public utils::HttpTransport {
public:
    void Push(int status, std::string body = "") {
        responses_.push_back({status, std::move(body)});
    }

    utils::HttpResponse Send(const utils::HttpRequest& request) override {
        requests.push_back(request);
        if (responses_.empty()) {
            throw std::logic_error("Unexpected request " + request.method + " " + request.target);
        }
        auto response = responses_.front();
        responses_.pop_front();
        return response;
    }

    std::vector<utils::HttpRequest> requests;

private:
    std::deque<utils::HttpResponse> responses_;
};

} // namespace fakes
} // namespace dockhand
