#include <mcp_host/plugin/tool.hpp>

namespace mcp_host {

ToolDescriptor ITool::Describe() const {
    return ToolDescriptor{Name(), Description(), InputSchema()};
}

NullProgressReporter& NullProgressReporter::Instance() {
    static NullProgressReporter instance;
    return instance;
}

} // namespace mcp_host
