#include "coursedl/progress_panel.hpp"

#include <algorithm>
#include <iterator>

#include <fmt/format.h>

namespace coursedl {

ProgressPanel::ProgressPanel(std::ostream& out) : out_(out) {}

void ProgressPanel::setLabel(const std::string& task_id, const std::string& label) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = rows_.try_emplace(task_id);
    if (inserted) {
        it->second.task_id = task_id;
        order_.push_back(task_id);
    }
    it->second.label = label;
}

void ProgressPanel::onEvent(const ProgressEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = rows_.try_emplace(event.task_id);
    Row& row = it->second;
    if (inserted) {
        row.task_id = event.task_id;
        row.label = event.task_id;
        order_.push_back(event.task_id);
    }
    row.status = event.status;
    row.bytes = event.bytes_downloaded;
    row.total = event.total_bytes.value_or(0);
}

std::string ProgressPanel::buildPanel() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string panel;
    panel.reserve(order_.size() * 128 + 256);
    panel.append("==================================================\n");
    panel += fmt::format("coursedl ({} tasks)\n", order_.size());
    panel.append("--------------------------------------------------\n");

    std::uint64_t total_all = 0;
    std::uint64_t downloaded_all = 0;
    std::size_t finished = 0;
    for (const auto& id : order_) {
        const Row& row = rows_.at(id);
        panel += formatRow(row);
        panel.push_back('\n');

        total_all += row.total;
        downloaded_all += std::min(row.bytes, row.total);
        if (isTerminal(row.status)) {
            ++finished;
        }
    }

    panel.append("--------------------------------------------------\n");
    if (total_all > 0) {
        const double ratio = static_cast<double>(downloaded_all) / static_cast<double>(total_all);
        panel += fmt::format("Overall: {:>3}%  ({}/{} tasks done)", static_cast<int>(ratio * 100.0), finished,
                             order_.size());
    } else {
        panel += fmt::format("Overall: N/A  ({}/{} tasks done)", finished, order_.size());
    }
    panel.push_back('\n');
    panel.append("==================================================\n");
    return panel;
}

void ProgressPanel::redraw() {
    const std::string panel = buildPanel();
    const auto current_lines = static_cast<std::size_t>(std::count(panel.begin(), panel.end(), '\n'));
    if (previous_lines_ > 0) {
        out_ << "\033[" << previous_lines_ << "F\033[J";
    }
    out_ << panel << std::flush;
    previous_lines_ = current_lines;
}

std::string ProgressPanel::formatRow(const Row& row) {
    std::string name = row.label.empty() ? row.task_id : row.label;
    if (name.size() > 20) {
        name = name.substr(0, 20);
    }
    if (name.empty()) {
        name = "(unnamed)";
    }

    switch (row.status) {
        case TransferStatus::Queued:
            return fmt::format("{:<20} [Queued]", name);
        case TransferStatus::Skipped:
            return fmt::format("{:<20} [Up to date] {}", name, formatSize(row.bytes));
        case TransferStatus::Failed:
            return fmt::format("{:<20} [Failed] ({})", name, formatSize(row.bytes));
        default:
            break;
    }

    if (row.total == 0) {
        return fmt::format("{:<20} [{}] {}", name, statusLabel(row.status), formatSize(row.bytes));
    }

    const double ratio = std::min(1.0, static_cast<double>(row.bytes) / static_cast<double>(row.total));
    const int percent = static_cast<int>(ratio * 100.0);
    constexpr int bar_width = 30;
    const int bar_pos = static_cast<int>(ratio * bar_width);

    std::string bar;
    bar.reserve(static_cast<std::size_t>(bar_width) * 3);
    for (int i = 0; i < bar_width; ++i) {
        bar += (i < bar_pos) ? "█" : "░";
    }

    std::string line = fmt::format("{:<20} [{}] {:>3}% ({}/{})", name, bar, percent, formatSize(row.bytes),
                                   formatSize(row.total));
    if (row.status == TransferStatus::Completed) {
        line.append("  Done");
    } else if (row.status == TransferStatus::Paused) {
        line.append("  Paused");
    }
    return line;
}

std::string ProgressPanel::formatSize(std::uint64_t bytes) {
    if (bytes < 1024) {
        return fmt::format("{} B", bytes);
    }
    static constexpr const char* kUnits[] = {"KB", "MB", "GB", "TB"};
    double value = static_cast<double>(bytes) / 1024.0;
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < std::size(kUnits)) {
        value /= 1024.0;
        ++unit;
    }
    return fmt::format("{:.1f} {}", value, kUnits[unit]);
}

} // namespace coursedl
