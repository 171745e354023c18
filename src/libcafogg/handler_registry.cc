//
// Created by igor on 14/08/2025.
//

#include <cafogg/handler_registry.hh>
#include <utility>

namespace cafogg {

    void handler_registry::on_chunk(fourcc chunk_id, chunk_handler handler) {
        m_chunk_handlers[chunk_id].push_back(std::move(handler));
    }

    void handler_registry::on_any_chunk(chunk_handler handler) {
        m_any_handlers.push_back(std::move(handler));
    }

    bool handler_registry::empty() const {
        return m_chunk_handlers.empty() && m_any_handlers.empty();
    }

    void handler_registry::emit(const chunk_event& event) const {
        // Collect all matching handlers with proper precedence
        std::vector<const chunk_handler*> handlers_to_call;

        // First tag-specific handlers
        auto it = m_chunk_handlers.find(event.header.type);
        if (it != m_chunk_handlers.end()) {
            for (const auto& handler : it->second) {
                handlers_to_call.push_back(&handler);
            }
        }

        // Then catch-all handlers
        for (const auto& handler : m_any_handlers) {
            handlers_to_call.push_back(&handler);
        }

        for (const auto* handler : handlers_to_call) {
            (*handler)(event);
        }
    }

} // namespace cafogg
