#include "reliable.hpp"
#include "../errors.hpp"
#include <iostream>
#include <stdexcept>

namespace graphmem {

ReliableProvider::ReliableProvider(std::vector<std::unique_ptr<Provider>> providers,
                                   uint32_t max_retries)
    : providers_(std::move(providers)), max_retries_(max_retries == 0 ? 1 : max_retries) {
    if (providers_.empty()) {
        throw std::invalid_argument("ReliableProvider requires at least one provider");
    }
}

template <typename Fn>
auto ReliableProvider::with_retries(Fn&& fn) -> decltype(fn(std::declval<Provider&>())) {
    std::string last_error;
    for (size_t i = 0; i < providers_.size(); ++i) {
        for (uint32_t retry = 0; retry < max_retries_; ++retry) {
            try {
                return fn(*providers_[i]);
            } catch (const GeneratorError& e) {
                if (!e.transient()) throw;
                last_error = e.what();
            } catch (const std::exception& e) {
                last_error = e.what();
            }
            std::cerr << "[reliable] Provider " << providers_[i]->provider_name()
                      << " attempt " << (retry + 1) << "/" << max_retries_
                      << " failed: " << last_error << '\n';
        }
    }
    throw GeneratorError("All providers failed. Last error: " + last_error, true);
}

ChatResponse ReliableProvider::chat(const std::vector<ChatMessage>& messages,
                                     const std::string& model,
                                     double temperature) {
    return with_retries([&](Provider& p) {
        return p.chat(messages, model, temperature);
    });
}

std::string ReliableProvider::chat_simple(const std::string& system_prompt,
                                           const std::string& message,
                                           const std::string& model,
                                           double temperature) {
    return with_retries([&](Provider& p) {
        return p.chat_simple(system_prompt, message, model, temperature);
    });
}

bool ReliableProvider::reachable() {
    for (auto& p : providers_) {
        if (p->reachable()) return true;
    }
    return false;
}

std::string ReliableProvider::provider_name() const {
    return providers_[0]->provider_name();
}

} // namespace graphmem
