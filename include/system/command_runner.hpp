#pragma once

#include "util/result.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace winusb {

struct CommandOutput {
    int exit_code = -1;
    // stdout and stderr, interleaved in arrival order.
    std::string output;
};

class ICommandRunner {
  public:
    virtual ~ICommandRunner() = default;

    // Fails only when the process could not be started or waited for; a non-zero
    // exit status is reported through out.exit_code.
    virtual Result Run(const std::vector<std::string>& argv,
                       std::string_view stdin_data,
                       CommandOutput& out) const = 0;
};

std::shared_ptr<const ICommandRunner> DefaultCommandRunner();

std::string JoinCommand(const std::vector<std::string>& argv);

} // namespace winusb
