#pragma once

#include <string>

namespace SandSim {

class Grid;

/**
 * CrashDumpHandler - Captures the grid state on assertion failures.
 *
 * Writes JSON snapshots of the installed Grid for post-mortem debugging.
 * SANDSIM_ASSERT and SANDSIM_VERIFY route through onAssertionFailure().
 */
class CrashDumpHandler {
public:
    /**
     * Install the handler for a grid. Call once after the grid is created.
     */
    static void install(const Grid* grid);

    static void uninstall();

    static bool isInstalled() { return installed_; }

    /**
     * Manually trigger a grid state dump.
     */
    static void dumpGridState(const char* reason = "manual_dump");

    /**
     * Directory for dump files. Default is the current working directory.
     */
    static void setDumpDirectory(const std::string& directory);

    // Path of the most recent dump file, empty if none was written.
    static const std::string& getLastDumpPath() { return last_dump_path_; }

    /**
     * Called by the assertion macros.
     */
    static void onAssertionFailure(
        const char* condition, const char* file, int line, const char* message);

private:
    static const Grid* grid_;
    static std::string dump_directory_;
    static std::string last_dump_path_;
    static bool installed_;

    static std::string generateDumpFilename(const char* reason);
    static bool writeGridStateToFile(
        const std::string& filename,
        const char* reason,
        const char* condition = nullptr,
        const char* file = nullptr,
        int line = 0,
        const char* message = nullptr);
};

} // namespace SandSim
