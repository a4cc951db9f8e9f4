#include "vm/context.hpp"

#include "vm/objects/layout.hpp"

#include <fmt/format.h>

#include <cstdio>

namespace mica::vm {

static ContextSettings default_settings(ContextSettings settings) {
    if (!settings.print_stdout) {
        settings.print_stdout = [](std::string_view message) {
            std::fwrite(message.data(), 1, message.size(), stdout);
            std::fflush(stdout);
        };
    }
    return settings;
}

Context::Context()
    : Context(ContextSettings{}) {}

Context::Context(ContextSettings settings)
    : settings_(default_settings(std::move(settings))) {
    if (settings_.trace_layouts) {
        layouts_.on_transition([this](const Layout& from, const Layout& to) {
            print(fmt::format(
                "layout transition: {} + {} -> {}\n", describe(from), to.names().back(), describe(to)));
        });
    }
    types_.init(*this);
}

Context::~Context() {}

void Context::print(std::string_view message) const {
    settings_.print_stdout(message);
}

} // namespace mica::vm
