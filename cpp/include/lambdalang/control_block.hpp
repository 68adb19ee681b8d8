#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace lambdalang {

class Context;

// {ns:cd} - activate one or more comma separated domains
struct NamespaceActivation {
    std::vector<std::string> codes;
};

// {def:key=value,key="quoted, value"} - install local definitions
struct DefinitionBlock {
    std::vector<std::pair<std::string, std::string>> entries;
};

// Any other {...} body. Emitted as a block, has no effect.
struct UnknownBlock {
    std::string body;
};

using ControlBlock = std::variant<NamespaceActivation, DefinitionBlock, UnknownBlock>;

/**
 * Parse the text between the braces of a control block.
 * Never throws; malformed pairs inside a def block are dropped.
 */
ControlBlock parse_control_block(std::string_view body);

// Apply a parsed block to the session context
void apply_control_block(const ControlBlock& block, Context& context);

} // namespace lambdalang
