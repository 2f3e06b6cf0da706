#include "io/in_memory_sink.h"

namespace flowbench {

void InMemorySink::append(const EventRecord& rec) {
    std::lock_guard<std::mutex> lk(mu_);
    events_.push_back(rec);
}

std::vector<EventRecord> InMemorySink::events() const {
    std::lock_guard<std::mutex> lk(mu_);
    return events_;
}

size_t InMemorySink::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return events_.size();
}

}  // namespace flowbench
