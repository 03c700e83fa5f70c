#ifndef ERRORCODE_HPP
#define ERRORCODE_HPP

#include <string>
#include <utility>

namespace ErrorCodes {

enum class Code {
    UNKNOWN_ERROR = 0,

    // Repository / version control (1000-1099)
    REPO_NOT_FOUND = 1000,
    REPO_NOT_A_WORK_TREE = 1001,
    VCS_EXECUTABLE_MISSING = 1002,
    VCS_COMMAND_FAILED = 1003,
    VCS_WORK_TREE_DIRTY = 1004,

    // Plan (1100-1199)
    PLAN_STALE_SNAPSHOT = 1100,
    PLAN_EMPTY = 1101,

    // File system (1200-1299)
    FILE_NOT_FOUND = 1200,
    FILE_OPEN_FAILED = 1201,
    FILE_WRITE_FAILED = 1202,
    DIRECTORY_CREATE_FAILED = 1203,

    // Undo journal (1300-1399)
    JOURNAL_LOAD_FAILED = 1300,
    JOURNAL_CORRUPTED = 1301,
    JOURNAL_WRITE_FAILED = 1302,
    JOURNAL_BUSY = 1303,
    JOURNAL_BATCH_NOT_FOUND = 1304,

    // Configuration (1500-1599)
    CONFIG_PARSE_ERROR = 1500,
    CONFIG_INVALID_VALUE = 1501,
    CONFIG_SAVE_FAILED = 1502,

    // Command line (1600-1699)
    CLI_INVALID_ARGUMENT = 1600,
    CLI_MISSING_VALUE = 1601
};

struct ErrorInfo {
    Code code{Code::UNKNOWN_ERROR};
    std::string message;
    std::string resolution;
    std::string context;

    ErrorInfo() = default;
    ErrorInfo(Code code, std::string message, std::string resolution, std::string context = "")
        : code(code),
          message(std::move(message)),
          resolution(std::move(resolution)),
          context(std::move(context)) {}

    std::string get_user_message() const;
    std::string get_full_details() const;
};

class ErrorCatalog {
public:
    static ErrorInfo get_error_info(Code code, const std::string& context = "");
};

} // namespace ErrorCodes

#endif // ERRORCODE_HPP
