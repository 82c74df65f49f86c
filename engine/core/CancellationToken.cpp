#include "CancellationToken.h"

#include <utility>

namespace Forge {

void CancellationToken::cancel() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancelled_) return;
    cancelled_ = true;
    if (interrupt_) interrupt_();
}

bool CancellationToken::cancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}

void CancellationToken::bind(std::function<void()> interrupt) {
    std::lock_guard<std::mutex> lock(mutex_);
    interrupt_ = std::move(interrupt);
    if (cancelled_ && interrupt_) interrupt_();
}

void CancellationToken::unbind() {
    std::lock_guard<std::mutex> lock(mutex_);
    interrupt_ = nullptr;
}

CancellationScope::CancellationScope(CancellationToken* token, std::function<void()> interrupt) : token_(token) {
    if (token_) token_->bind(std::move(interrupt));
}

CancellationScope::~CancellationScope() {
    if (token_) token_->unbind();
}

}  // namespace Forge
