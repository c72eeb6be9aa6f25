#include "tool_handlers/tool_handlers.hpp"
#include "tool_handlers/tool_run_command.hpp"

namespace tool_handlers {

void register_all_tools() {
    tool_run_command::register_tool();
}

} // namespace tool_handlers
