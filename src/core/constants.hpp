#pragma once

// ── Versions ────────────────────────────────────────────────
constexpr const char* TEMPLATIVE_VERSION = "0.4.0";
constexpr int CONFIG_VERSION             = 1;     // highest config.yaml version understood
constexpr int REGISTRY_VERSION           = 1;     // templates.yaml version (exact match required)
constexpr int CACHE_INDEX_VERSION        = 1;

// ── File names ──────────────────────────────────────────────
constexpr const char* CONFIG_FILENAME      = "config.yaml";
constexpr const char* REGISTRY_FILENAME    = "templates.yaml";
constexpr const char* CACHE_INDEX_FILENAME = "index.yaml";
constexpr const char* APP_DIR_NAME         = "templative";

// ── Environment overrides ───────────────────────────────────
constexpr const char* ENV_CONFIG_DIR = "TEMPLATIVE_CONFIG_DIR";
constexpr const char* ENV_CACHE_DIR  = "TEMPLATIVE_CACHE_DIR";
constexpr const char* ENV_GIT        = "TEMPLATIVE_GIT";  // alternate git executable

// ── Git ─────────────────────────────────────────────────────
// Runtime format strings: fmt::format(fmt::runtime(FRESH_COMMIT_MESSAGE), template_name)
constexpr const char* FRESH_COMMIT_MESSAGE      = "Initial commit from template: {}";
constexpr const char* CHECKPOINT_COMMIT_MESSAGE = "Apply template exclusions: {}";
constexpr const char* DEFAULT_GIT_EXECUTABLE    = "git";
constexpr const char* GIT_DIR_NAME              = ".git";

// ── Hooks ───────────────────────────────────────────────────
constexpr const char* HOOK_SHELL = "/bin/sh";

// ── Config defaults ─────────────────────────────────────────
constexpr const char* DEFAULT_EXCLUDES[] = {"node_modules", ".DS_Store"};

// ── Output ──────────────────────────────────────────────────
constexpr int SHORT_SHA_LENGTH = 7;
