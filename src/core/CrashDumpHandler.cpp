#include "CrashDumpHandler.h"
#include "Grid.h"

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <sstream>

namespace SandSim {

const Grid* CrashDumpHandler::grid_ = nullptr;
std::string CrashDumpHandler::dump_directory_ = "./";
std::string CrashDumpHandler::last_dump_path_;
bool CrashDumpHandler::installed_ = false;

void CrashDumpHandler::install(const Grid* grid)
{
    if (installed_) {
        spdlog::warn("CrashDumpHandler already installed, replacing grid");
    }

    grid_ = grid;
    installed_ = true;

    spdlog::debug("CrashDumpHandler installed - crash dumps will be saved to: {}", dump_directory_);
}

void CrashDumpHandler::uninstall()
{
    if (!installed_) {
        return;
    }

    grid_ = nullptr;
    installed_ = false;

    spdlog::debug("CrashDumpHandler uninstalled");
}

void CrashDumpHandler::setDumpDirectory(const std::string& directory)
{
    dump_directory_ = directory;
    if (!dump_directory_.empty() && dump_directory_.back() != '/') {
        dump_directory_ += '/';
    }

    spdlog::debug("CrashDumpHandler dump directory set to: {}", dump_directory_);
}

void CrashDumpHandler::dumpGridState(const char* reason)
{
    if (!installed_ || !grid_) {
        spdlog::error("CrashDumpHandler not installed or no grid available for dump");
        return;
    }

    std::string filename = generateDumpFilename(reason);
    if (writeGridStateToFile(filename, reason)) {
        spdlog::info("Grid dump ({}) written to {}", reason, filename);
    }
}

void CrashDumpHandler::onAssertionFailure(
    const char* condition, const char* file, int line, const char* message)
{
    spdlog::error(
        "ASSERTION FAILURE: {} at {}:{} - {}", condition, file, line, message ? message : "");

    if (!installed_ || !grid_) {
        spdlog::error("CrashDumpHandler not available for crash dump");
        return;
    }

    std::string filename = generateDumpFilename("assertion_failure");
    if (writeGridStateToFile(filename, "assertion_failure", condition, file, line, message)) {
        spdlog::error(
            "Crash dump saved to: {} (grid {}x{}, tick {})",
            filename,
            grid_->getWidth(),
            grid_->getHeight(),
            grid_->getTimestep());
    }
}

std::string CrashDumpHandler::generateDumpFilename(const char* reason)
{
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::stringstream filename;
    filename << dump_directory_ << "crash-dump-";
    filename << std::put_time(std::localtime(&time_t), "%Y%m%d-%H%M%S");
    filename << "-" << std::setfill('0') << std::setw(3) << ms.count();
    filename << "-" << reason << ".json";

    return filename.str();
}

bool CrashDumpHandler::writeGridStateToFile(
    const std::string& filename,
    const char* reason,
    const char* condition,
    const char* file,
    int line,
    const char* message)
{
    try {
        nlohmann::json doc;

        doc["crash_info"]["reason"] = reason;

        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        char timestamp[64];
        std::strftime(timestamp, sizeof(timestamp), "%Y-%m-%d %H:%M:%S", std::localtime(&time_t));
        doc["crash_info"]["timestamp"] = timestamp;

        if (condition) {
            doc["crash_info"]["assertion_condition"] = condition;
        }
        if (file) {
            doc["crash_info"]["source_file"] = file;
        }
        if (line > 0) {
            doc["crash_info"]["source_line"] = line;
        }
        if (message) {
            doc["crash_info"]["assertion_message"] = message;
        }

        doc["grid_info"]["occupied"] = grid_->countOccupied();
        doc["grid_state"] = grid_->toJson();

        std::ofstream file_stream(filename);
        if (!file_stream.is_open()) {
            spdlog::error("Failed to open crash dump file: {}", filename);
            return false;
        }

        file_stream << doc.dump(2);
        last_dump_path_ = filename;
        return true;
    }
    catch (const std::exception& e) {
        spdlog::error("Exception while writing crash dump: {}", e.what());
        return false;
    }
}

} // namespace SandSim
