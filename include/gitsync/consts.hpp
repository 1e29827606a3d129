#pragma once
#include <cstdint>
#include <string_view>

namespace gitsync::consts {

// Directory and file names
inline constexpr std::string_view kGitDir      = ".git";
inline constexpr std::string_view kGitModules  = ".gitmodules";
inline constexpr std::string_view kConfigFile  = "gitsync.conf";

// Private reference the snapshots are pushed to (outside refs/heads)
inline constexpr std::string_view kSyncRef     = "refs/gitsync/snapshot";

// Git object type strings
inline constexpr std::string_view kTypeBlob    = "blob";
inline constexpr std::string_view kTypeTree    = "tree";
inline constexpr std::string_view kTypeCommit  = "commit";

// File modes (octal)
inline constexpr std::uint32_t kModeFile    = 0100644; // regular file
inline constexpr std::uint32_t kModeExec    = 0100755; // executable file
inline constexpr std::uint32_t kModeLink    = 0120000; // symbolic link
inline constexpr std::uint32_t kModeTree    = 0040000; // directory entry in tree
inline constexpr std::uint32_t kModeGitlink = 0160000; // submodule mount

// ——— Object ID sizes ———
inline constexpr std::size_t kOidRawLen = 20;  // 20 bytes (SHA-1)
inline constexpr std::size_t kOidHexLen = 40;  // 40 hex chars (SHA-1)

// ——— Object store fanout ———
inline constexpr std::size_t kFanoutDirHexLen = 2; // "aa/" + "bbbb..." in objects/

// ——— Synthetic commit identity ———
// Timestamp 0 is the earliest the commit format accepts; keeps ids stable across hosts.
inline constexpr std::string_view kSyncName    = "gitsync";
inline constexpr std::string_view kSyncEmail   = "gitsync@localhost";
inline constexpr std::int64_t     kSyncTime    = 0;
inline constexpr std::string_view kSyncMessage = "gitsync snapshot\n";

// ——— Commit header prefixes (used in parsing/formatting) ———
inline constexpr std::string_view kTreePrefix      = "tree ";
inline constexpr std::string_view kParentPrefix    = "parent ";
inline constexpr std::string_view kAuthorPrefix    = "author ";
inline constexpr std::string_view kCommitterPrefix = "committer ";

// ——— Common characters ———
inline constexpr char kSpace = ' ';
inline constexpr char kNul   = '\0';
inline constexpr char kLF    = '\n';
inline constexpr char kTab   = '\t';

// ——— Exit status a test uses to report "skipped" to CTest ———
inline constexpr int kSkipExit = 77;

} // namespace gitsync::consts
