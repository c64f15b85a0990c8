#include <routematch/track/observers.hpp>

namespace routematch::track {

alignment_event_collector::alignment_event_collector() = default;
alignment_event_collector::~alignment_event_collector() = default;

void alignment_event_collector::on_search_window(search_window_event ev) {
    events_.emplace_back(ev);
}

void alignment_event_collector::on_match(match_event ev) {
    events_.emplace_back(ev);
}

void alignment_event_collector::on_no_match(no_match_event ev) {
    events_.emplace_back(ev);
}

const std::vector<alignment_event_collector::event>& alignment_event_collector::events() const {
    return events_;
}

alignment_event_collector::const_iterator alignment_event_collector::cbegin() const noexcept {
    using std::cbegin;
    return cbegin(events());
}

alignment_event_collector::const_iterator alignment_event_collector::cend() const noexcept {
    using std::cend;
    return cend(events());
}

alignment_event_collector::const_iterator alignment_event_collector::begin() const noexcept {
    return cbegin();
}

alignment_event_collector::const_iterator alignment_event_collector::end() const noexcept {
    return cend();
}

}  // namespace routematch::track
