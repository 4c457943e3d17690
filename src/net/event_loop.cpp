#include "streamgate/net/io_context.hpp"

namespace streamgate::net {

namespace {

thread_local Dispatcher loop_dispatcher;

} // anonymous namespace

void detail::set_current_dispatcher(Dispatcher dispatcher) {
    loop_dispatcher = std::move(dispatcher);
}

Dispatcher current_dispatcher() {
    if (loop_dispatcher) {
        return loop_dispatcher;
    }
    return [](std::function<void()> fn) { fn(); };
}

} // namespace streamgate::net
