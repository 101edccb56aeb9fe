#include "hostlink/admin_interpreter.h"
#include "hostlink/text.h"

#include <algorithm>

namespace hostlink {

void AdminInterpreter::register_root(CommandRoot root) {
    std::lock_guard<std::mutex> lk(mu_);
    for (auto& r : roots_) {
        if (r.owner_id == root.owner_id && r.node.label() == root.node.label()) {
            r = std::move(root);
            return;
        }
    }
    roots_.push_back(std::move(root));
}

void AdminInterpreter::unregister_owner(const std::string& owner_id) {
    std::lock_guard<std::mutex> lk(mu_);
    roots_.erase(std::remove_if(roots_.begin(), roots_.end(),
                                [&](const CommandRoot& r) { return r.owner_id == owner_id; }),
                 roots_.end());
}

std::vector<CommandRoot> AdminInterpreter::roots() const {
    std::lock_guard<std::mutex> lk(mu_);
    return roots_;
}

bool AdminInterpreter::execute(const std::string& command, ReplySink& sink) const {
    const auto tokens = text::split_ws(command);
    if (tokens.empty()) {
        sink.append("Unknown command: (empty)");
        return false;
    }

    // Handlers run without the lock so they may inspect the interpreter.
    const auto snapshot = roots();
    for (const auto& root : snapshot) {
        if (!root.node.is_literal() || root.node.label() != tokens[0]) continue;

        const CommandNode* cur = &root.node;
        std::vector<std::string> args;
        for (size_t i = 1; i < tokens.size(); i++) {
            const CommandNode* next = nullptr;
            for (const auto& child : cur->children()) {
                if (child.is_literal() && child.label() == tokens[i]) { next = &child; break; }
            }
            if (!next) {
                for (const auto& child : cur->children()) {
                    if (!child.is_literal()) { next = &child; break; }
                }
                if (next) args.push_back(tokens[i]);
            }
            if (!next) {
                std::vector<std::string> head(tokens.begin(), tokens.begin() + (std::ptrdiff_t)i);
                sink.append("Unknown command: " + command + " (unexpected '" + tokens[i] +
                            "' after '" + text::join(head, " ") + "')");
                return false;
            }
            cur = next;
        }

        if (!cur->executable()) {
            sink.append("Incomplete command: " + command);
            return false;
        }
        cur->handler()(sink, args);
        return true;
    }

    sink.append("Unknown command: " + command);
    return false;
}

} // namespace hostlink
