#include <ninja_split/declaration_sink.hpp>
#include <algorithm>

namespace ninja_split {

void DeclarationCollector::accept(const ByteRegion& declaration) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (declarations_.size() >= accept_limit_) {
        ++rejected_;
        throw SinkRejected(declarations_.size(), declaration.offset());
    }
    declarations_.push_back(Declaration{declaration.offset(), declaration.to_string()});
}

std::vector<Declaration> DeclarationCollector::received() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return declarations_;
}

std::vector<Declaration> DeclarationCollector::sorted() const {
    std::vector<Declaration> result = received();
    std::sort(result.begin(), result.end());
    return result;
}

std::size_t DeclarationCollector::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return declarations_.size();
}

std::size_t DeclarationCollector::rejected_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rejected_;
}

void DeclarationCollector::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    declarations_.clear();
    rejected_ = 0;
}

std::string DeclarationCollector::reassemble() const {
    std::string text;
    for (const auto& declaration : sorted()) {
        text += declaration.text;
    }
    return text;
}

} // namespace ninja_split
