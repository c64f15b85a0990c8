#pragma once

#include <variant>
#include <vector>

#include <routematch/track/alignment.hpp>

namespace routematch::track {

///
/// Observer that collects all alignment events for later inspection.
///
/// Stores search-window, match and no-match events in order of occurrence.
///
/// @code
/// alignment_event_collector collector;
/// auto aligned = align_track_endpoints(t1, t2, {.observer = &collector});
/// for (const auto& ev : collector) {
///     // Inspect each event
/// }
/// @endcode
///
class alignment_event_collector final : public alignment_observer {
   public:
    using event = std::variant<search_window_event, match_event, no_match_event>;

    ///
    /// Constructs an empty event collector.
    ///
    alignment_event_collector();

    ///
    /// Destructor.
    ///
    ~alignment_event_collector() override;

    void on_search_window(search_window_event ev) override;

    void on_match(match_event ev) override;

    void on_no_match(no_match_event ev) override;

    ///
    /// Gets all collected events.
    ///
    /// @return Vector of events in order of occurrence
    ///
    const std::vector<event>& events() const;

    using const_iterator = std::vector<event>::const_iterator;

    const_iterator cbegin() const noexcept;

    const_iterator cend() const noexcept;

    const_iterator begin() const noexcept;

    const_iterator end() const noexcept;

   private:
    std::vector<event> events_;
};

}  // namespace routematch::track
