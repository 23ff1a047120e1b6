#include "errors.hpp"

struct ErrorInfo {
    ErrorCode code;
    int exit_code;
};

// One row per ErrorCode; exit codes are part of the CLI contract.
static constexpr ErrorInfo kErrorTable[] = {
    {ErrorCode::None,                 0},
    {ErrorCode::General,              1},
    {ErrorCode::Usage,                2},
    {ErrorCode::ConfigInvalid,        3},
    {ErrorCode::RegistryInvalid,      4},
    {ErrorCode::TemplateNotFound,     5},
    {ErrorCode::TemplateExists,       6},
    {ErrorCode::TemplatePathMissing,  7},
    {ErrorCode::DangerousPath,        8},
    {ErrorCode::SourceUnreadable,     10},
    {ErrorCode::RecursiveInit,        11},
    {ErrorCode::CollisionStrict,      12},
    {ErrorCode::CollisionNoOverwrite, 13},
    {ErrorCode::SymlinkCycle,         14},
    {ErrorCode::IoFailure,            15},
    {ErrorCode::GitFailure,           20},
    {ErrorCode::GitIdentityMissing,   21},
    {ErrorCode::HookFailure,          22},
    {ErrorCode::UpdateFailed,         23},
};

static const ErrorInfo* find_info(ErrorCode code) {
    for (const auto& info : kErrorTable) {
        if (info.code == code) return &info;
    }
    return nullptr;
}

int exit_code_for(ErrorCode code) {
    const auto* info = find_info(code);
    return info ? info->exit_code : 1;
}
