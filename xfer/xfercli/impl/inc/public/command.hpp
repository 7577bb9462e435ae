#ifndef XFERCLI_COMMAND_HPP_
#define XFERCLI_COMMAND_HPP_

#include <string>
#include <vector>

namespace xfercli
{
struct Command
{
    std::string              name;
    std::vector<std::string> args;
};
}  // namespace xfercli

#endif  // XFERCLI_COMMAND_HPP_
