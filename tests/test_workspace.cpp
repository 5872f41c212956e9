#include "test_framework.hpp"

#include "crucible/common/digest.hpp"
#include "crucible/workspace/file_tools.hpp"
#include "crucible/workspace/path_resolver.hpp"
#include "crucible/workspace/snapshot.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <filesystem>
#include <fstream>

namespace {

std::filesystem::path canonical(const std::filesystem::path &path) {
  return std::filesystem::weakly_canonical(path);
}

} // namespace

void register_workspace_tests(std::vector<crucible::tests::TestCase> &tests) {
  using crucible::tests::require;
  namespace ws = crucible::workspace;
  using crucible::common::ErrorKind;
  using crucible::testing::TempWorkspace;

  tests.push_back({"resolver_accepts_paths_inside_root", [] {
                     TempWorkspace workspace;
                     const auto root = ::canonical(workspace.path());

                     const auto plain = ws::resolve_within_root(workspace.path(), "src/main.py");
                     require(plain.ok(), plain.error());
                     require(plain.value() == root / "src" / "main.py", "relative path joins root");

                     const auto dotted = ws::resolve_within_root(workspace.path(), "a/../b.txt");
                     require(dotted.ok() && dotted.value() == root / "b.txt",
                             "inner .. should normalize");

                     const auto itself = ws::resolve_within_root(workspace.path(), ".");
                     require(itself.ok() && itself.value() == root, "root itself is allowed");

                     const auto absolute =
                         ws::resolve_within_root(workspace.path(), (root / "x.txt").string());
                     require(absolute.ok() && absolute.value() == root / "x.txt",
                             "absolute path under root is allowed");
                   }});

  tests.push_back({"resolver_rejects_escapes", [] {
                     TempWorkspace workspace;
                     for (const std::string bad :
                          {"../outside.txt", "a/../../outside.txt", "/etc/passwd", "..", "./../.."}) {
                       const auto resolved = ws::resolve_within_root(workspace.path(), bad);
                       require(!resolved.ok(), "should reject " + bad);
                       require(resolved.kind() == ErrorKind::PathSecurity,
                               "escape should be a path security error: " + bad);
                     }
                     const std::string with_nul("a\0b", 3);
                     require(ws::resolve_within_root(workspace.path(), with_nul).kind() ==
                                 ErrorKind::PathSecurity,
                             "NUL byte should be rejected");
                     require(ws::resolve_within_root("", "a.txt").kind() == ErrorKind::Configuration,
                             "empty root is a configuration error");
                   }});

  tests.push_back({"resolver_rejects_sibling_with_shared_prefix", [] {
                     TempWorkspace workspace;
                     const auto root = workspace.path() / "box";
                     std::filesystem::create_directories(root);
                     std::filesystem::create_directories(workspace.path() / "box-evil");
                     const auto resolved = ws::resolve_within_root(root, "../box-evil/x");
                     require(!resolved.ok(), "sibling directory sharing a prefix must be rejected");
                   }});

  tests.push_back({"resolver_follows_symlinks_before_checking", [] {
                     TempWorkspace outside;
                     TempWorkspace workspace;
                     std::filesystem::create_directory_symlink(outside.path(),
                                                               workspace.path() / "link");
                     const auto resolved = ws::resolve_within_root(workspace.path(), "link/secret");
                     require(!resolved.ok() && resolved.kind() == ErrorKind::PathSecurity,
                             "symlink pointing outside must be rejected");
                   }});

  tests.push_back({"mapping_uses_longest_prefix", [] {
                     const ws::PathMappings mappings = {
                         {.container_prefix = "/app", .local_prefix = "/srv/app"},
                         {.container_prefix = "/app/data", .local_prefix = "/srv/data"},
                     };
                     require(ws::map_container_path("/app/data/x.csv", mappings) == "/srv/data/x.csv",
                             "longest prefix should win");
                     require(ws::map_container_path("/app/main.py", mappings) == "/srv/app/main.py",
                             "shorter prefix applies otherwise");
                     require(ws::map_container_path("/app", mappings) == "/srv/app",
                             "exact prefix maps to local prefix");
                     require(ws::map_container_path("/application/x", mappings) == "/application/x",
                             "prefix must match whole components");
                     require(ws::map_container_path("rel/x", mappings) == "rel/x",
                             "unmatched path is unchanged");
                   }});

  tests.push_back({"mapped_paths_are_still_confined", [] {
                     TempWorkspace workspace;
                     const auto root = ::canonical(workspace.path());
                     const ws::PathMappings mappings = {
                         {.container_prefix = "/workspace", .local_prefix = root.string()},
                         {.container_prefix = "/escape", .local_prefix = "/etc"},
                     };
                     const auto inside =
                         ws::resolve_within_root(workspace.path(), "/workspace/out/a.txt", mappings);
                     require(inside.ok() && inside.value() == root / "out" / "a.txt",
                             "container path should map into root");
                     const auto escaped =
                         ws::resolve_within_root(workspace.path(), "/escape/passwd", mappings);
                     require(!escaped.ok(), "mapping outside root must still be rejected");
                   }});

  tests.push_back({"file_tools_round_trip_binary_content", [] {
                     TempWorkspace workspace;
                     ws::FileTools files(workspace.path());
                     std::string bytes;
                     for (int i = 0; i < 256; ++i) {
                       bytes.push_back(static_cast<char>(i));
                     }
                     const auto written = files.write_file("bin/blob.dat", bytes);
                     require(written.ok(), written.error());
                     require(written.value() == "bin/blob.dat", "write returns the given path");

                     const auto raw = files.read_file_bytes("bin/blob.dat");
                     require(raw.ok() && raw.value() == bytes, "bytes should round trip");
                     const auto encoded = files.read_file("bin/blob.dat");
                     require(encoded.ok(), encoded.error());
                     require(encoded.value() == crucible::common::base64_encode(bytes),
                             "read_file returns base64");
                   }});

  tests.push_back({"file_tools_reject_escape_without_writing", [] {
                     TempWorkspace outside;
                     const auto root = outside.path() / "root";
                     std::filesystem::create_directories(root);
                     ws::FileTools files(root);
                     const auto written = files.write_file("../leak.txt", "x");
                     require(!written.ok() && written.kind() == ErrorKind::PathSecurity,
                             "escape should fail");
                     require(!std::filesystem::exists(outside.path() / "leak.txt"),
                             "nothing may be written outside the root");
                   }});

  tests.push_back({"file_tools_write_ignores_planted_links", [] {
                     TempWorkspace root;
                     TempWorkspace outside;
                     outside.create_file("victim.txt", "original");
                     std::filesystem::create_symlink(outside.path() / "victim.txt",
                                                     root.path() / "a.txt.tmp");
                     ws::FileTools files(root.path());
                     const auto written = files.write_file("a.txt", "replaced");
                     require(written.ok(), written.error());
                     require(outside.read("victim.txt") == "original",
                             "write must not go through a link beside the target");

                     std::filesystem::create_symlink(outside.path() / "victim.txt",
                                                     root.path() / "escape.txt");
                     const auto through = files.write_file("escape.txt", "replaced");
                     require(!through.ok() && through.kind() == ErrorKind::PathSecurity,
                             "link leading out of the root rejected");
                     require(outside.read("victim.txt") == "original", "outside file untouched");
                   }});

  tests.push_back({"file_tools_write_over_directory_fails", [] {
                     TempWorkspace workspace;
                     std::filesystem::create_directories(workspace.path() / "dir");
                     ws::FileTools files(workspace.path());
                     require(!files.write_file("dir", "x").ok(), "writing onto a directory should fail");
                     require(files.read_file("missing.txt").kind() == ErrorKind::NotFound,
                             "missing file should be not found");
                   }});

  tests.push_back({"list_files_is_sorted_and_marks_directories", [] {
                     TempWorkspace workspace;
                     workspace.create_file("b.txt", "b");
                     workspace.create_file("a/z.txt", "z");
                     workspace.create_file("a/nested/y.txt", "y");
                     ws::FileTools files(workspace.path());
                     const auto listed = files.list_files();
                     require(listed.ok(), listed.error());
                     const std::vector<std::string> expected = {"a/", "a/nested/", "a/nested/y.txt",
                                                                "a/z.txt", "b.txt"};
                     require(listed.value() == expected, "listing should be sorted and recursive");

                     const auto sub = files.list_files("a/nested");
                     require(sub.ok() && sub.value() == std::vector<std::string>{"y.txt"},
                             "listing is relative to the requested directory");
                     require(files.list_files("nope").kind() == ErrorKind::NotFound,
                             "missing directory should be not found");
                   }});

  tests.push_back({"create_file_structure_reports_dirs_files_and_summary", [] {
                     TempWorkspace workspace;
                     ws::FileTools files(workspace.path());
                     ws::FileStructure structure;
                     structure.dirs = {"assets"};
                     structure.files = {
                         {.path = "src/app.py", .content = "print 1", .description = "entry point"},
                         {.path = "README.md", .content = "# hi", .description = std::nullopt},
                     };
                     structure.dependencies = {"requests"};

                     const auto created = files.create_file_structure(structure);
                     require(created.ok(), created.error());
                     const auto &result = created.value();
                     require(result.dirs == std::vector<std::string>{"assets/", "src/"},
                             "new directories listed with trailing slash");
                     require(result.files.size() == 2, "two files created");
                     require(result.files[0].description.value_or("") == "entry point",
                             "description carried through");
                     require(result.dependencies == std::vector<std::string>{"requests"},
                             "dependencies carried through");
                     require(result.summary ==
                                 "Created 2 directories\nassets/\nsrc/\nGenerated 2 files\nsrc/app.py\nREADME.md",
                             "summary text mismatch: " + result.summary);
                     require(workspace.read("src/app.py") == "print 1", "file content written");
                   }});

  tests.push_back({"create_file_structure_is_all_or_nothing_on_bad_path", [] {
                     TempWorkspace workspace;
                     ws::FileTools files(workspace.path());
                     ws::FileStructure structure;
                     structure.files = {
                         {.path = "ok.txt", .content = "fine", .description = std::nullopt},
                         {.path = "../../evil.txt", .content = "bad", .description = std::nullopt},
                     };
                     const auto created = files.create_file_structure(structure);
                     require(!created.ok() && created.kind() == ErrorKind::PathSecurity,
                             "bad path should fail the whole structure");
                     require(!std::filesystem::exists(workspace.path() / "ok.txt"),
                             "no file may be written when any path is rejected");
                   }});

  tests.push_back({"snapshot_diff_reports_new_and_changed_files", [] {
                     TempWorkspace workspace;
                     workspace.create_file("a.txt", "one");
                     workspace.create_file("keep.txt", "same");
                     const auto before = ws::capture_snapshot(workspace.path());
                     require(before.ok(), before.error());

                     workspace.create_file("a.txt", "two");
                     workspace.create_file("b.txt", "new");
                     workspace.create_file("keep.txt", "same");
                     const auto after = ws::capture_snapshot(workspace.path());
                     require(after.ok(), after.error());

                     const auto diff = ws::diff_snapshots(before.value(), after.value());
                     require(diff == std::vector<std::string>{"a.txt", "b.txt"},
                             "edited and new files expected, rewritten identical content ignored");
                   }});

  tests.push_back({"snapshot_records_symlinks_without_following", [] {
                     TempWorkspace outside;
                     outside.create_file("target.txt", "secret");
                     TempWorkspace workspace;
                     std::filesystem::create_directory_symlink(outside.path(),
                                                               workspace.path() / "link");
                     const auto snapshot = ws::capture_snapshot(workspace.path());
                     require(snapshot.ok(), snapshot.error());
                     require(snapshot.value().count("link") == 1, "symlink itself is recorded");
                     require(snapshot.value().count("link/target.txt") == 0,
                             "symlinked directory is not descended");
                   }});

  tests.push_back({"snapshot_of_missing_root_is_empty", [] {
                     TempWorkspace workspace;
                     const auto snapshot = ws::capture_snapshot(workspace.path() / "absent");
                     require(snapshot.ok() && snapshot.value().empty(), "missing root yields nothing");
                   }});
}
