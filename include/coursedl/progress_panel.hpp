#pragma once

#include "progress.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <ostream>
#include <string>
#include <vector>

namespace coursedl {

// Terminal panel fed by ProgressEvents. Events may arrive from any thread;
// redraw() is meant to be called periodically from one thread.
class ProgressPanel {
public:
    struct Row {
        std::string task_id;
        std::string label;
        TransferStatus status{TransferStatus::Queued};
        std::uint64_t bytes{0};
        std::uint64_t total{0};
    };

    explicit ProgressPanel(std::ostream& out);

    // Sets the display name shown for a task, e.g. its file name.
    void setLabel(const std::string& task_id, const std::string& label);

    void onEvent(const ProgressEvent& event);

    // Rewrites the previously drawn panel in place.
    void redraw();

    [[nodiscard]] std::string buildPanel() const;

    static std::string formatRow(const Row& row);
    static std::string formatSize(std::uint64_t bytes);

private:
    std::ostream& out_;
    std::map<std::string, Row> rows_;
    std::vector<std::string> order_;
    std::size_t previous_lines_{0};
    mutable std::mutex mutex_;
};

} // namespace coursedl
