#include "hostlink/host.h"

#include <utility>

namespace hostlink {

CommandNode CommandNode::literal(std::string text, std::string description, CommandHandler handler) {
    CommandNode n;
    n.node = LiteralNode{std::move(text), std::move(description), std::move(handler), {}};
    return n;
}

CommandNode CommandNode::argument(std::string name, std::string description, CommandHandler handler) {
    CommandNode n;
    n.node = ArgumentNode{std::move(name), std::move(description), std::move(handler), {}};
    return n;
}

CommandNode& CommandNode::then(CommandNode child) {
    std::visit([&](auto& n) { n.children.push_back(std::move(child)); }, node);
    return *this;
}

const std::string& CommandNode::label() const {
    if (auto* l = std::get_if<LiteralNode>(&node)) return l->text;
    return std::get<ArgumentNode>(node).name;
}

const std::string& CommandNode::description() const {
    return std::visit([](const auto& n) -> const std::string& { return n.description; }, node);
}

const CommandHandler& CommandNode::handler() const {
    return std::visit([](const auto& n) -> const CommandHandler& { return n.handler; }, node);
}

const std::vector<CommandNode>& CommandNode::children() const {
    return std::visit([](const auto& n) -> const std::vector<CommandNode>& { return n.children; }, node);
}

} // namespace hostlink
