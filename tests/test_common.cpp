#include "test_framework.hpp"

#include "crucible/common/cancellation.hpp"
#include "crucible/common/digest.hpp"
#include "crucible/common/fs.hpp"
#include "crucible/common/json_util.hpp"
#include "crucible/common/toml.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <filesystem>

void register_common_tests(std::vector<crucible::tests::TestCase> &tests) {
  using crucible::tests::require;
  namespace common = crucible::common;

  tests.push_back({"toml_parses_sections_arrays_and_scalars", [] {
                     const auto parsed = common::parse_toml(R"(
# comment
[pool]
max_size = 4
enabled = true
ratio = 0.5

[languages.ruby]
image = "ruby:3.3"
inline_command = ["ruby", "code.rb"]
)");
                     require(parsed.ok(), parsed.error());
                     const auto &doc = parsed.value();
                     require(doc.get_u64("pool.max_size", 0) == 4, "max_size should parse");
                     require(doc.get_bool("pool.enabled", false), "bool should parse");
                     require(doc.get_double("pool.ratio", 0.0) == 0.5, "double should parse");
                     require(doc.get_string("languages.ruby.image") == "ruby:3.3",
                             "nested table key should flatten");
                     const auto command = doc.get_string_array("languages.ruby.inline_command");
                     require(command.size() == 2 && command[1] == "code.rb",
                             "string array should parse");
                     const auto tables = doc.table_names("languages");
                     require(tables.size() == 1 && tables[0] == "ruby", "table names should list ruby");
                   }});

  tests.push_back({"toml_rejects_malformed_line", [] {
                     const auto parsed = common::parse_toml("[pool\nmax_size = 3\n");
                     require(!parsed.ok(), "unterminated table header should fail");
                     require(parsed.kind() == common::ErrorKind::Configuration,
                             "parse errors are configuration errors");
                   }});

  tests.push_back({"sha256_matches_known_vector", [] {
                     require(common::sha256_hex("abc") ==
                                 "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
                             "sha256(abc) mismatch");
                   }});

  tests.push_back({"base64_encodes_and_rejects_garbage", [] {
                     require(common::base64_encode("hello") == "aGVsbG8=", "base64(hello) mismatch");
                     const auto decoded = common::base64_decode("aGVsbG8=");
                     require(decoded.ok() && decoded.value() == "hello", "base64 decode mismatch");
                     require(!common::base64_decode("not base64 !!").ok(),
                             "invalid base64 should fail");
                   }});

  tests.push_back({"json_helpers_extract_fields", [] {
                     const std::string json =
                         R"({"path":"a \"b\".txt","n":42,"list":["x","y"],"files":[{"p":"1"},{"p":"2"}]})";
                     require(common::json_get_string(json, "path") == "a \"b\".txt",
                             "escaped string should unescape");
                     require(common::json_get_number(json, "n") == "42", "number should extract");
                     const auto list = common::json_get_string_array(json, "list");
                     require(list.size() == 2 && list[0] == "x", "string array should extract");
                     const auto objects =
                         common::json_split_top_level_objects(common::json_get_array(json, "files"));
                     require(objects.size() == 2, "two objects expected");
                     require(common::json_get_string(objects[1], "p") == "2", "second object field");
                     require(common::json_escape("a\nb") == "a\\nb", "newline should escape");
                   }});

  tests.push_back({"write_file_atomic_creates_parents_and_leaves_no_tmp", [] {
                     crucible::testing::TempWorkspace workspace;
                     const auto target = workspace.path() / "deep" / "nested" / "file.bin";
                     const std::string bytes("\x00\x01\xff", 3);
                     const auto written = common::write_file_atomic(target, bytes);
                     require(written.ok(), written.error());
                     const auto read = common::read_file_bytes(target);
                     require(read.ok() && read.value() == bytes, "bytes should round trip");
                     std::size_t entries = 0;
                     for (const auto &entry : std::filesystem::directory_iterator(target.parent_path())) {
                       (void)entry;
                       ++entries;
                     }
                     require(entries == 1, "temporary file should be renamed away");
                   }});

  tests.push_back({"write_file_atomic_ignores_planted_temp_symlink", [] {
                     crucible::testing::TempWorkspace root;
                     crucible::testing::TempWorkspace outside;
                     outside.create_file("victim.txt", "original");
                     std::filesystem::create_symlink(outside.path() / "victim.txt",
                                                     root.path() / "a.txt.tmp");
                     const auto written = common::write_file_atomic(root.path() / "a.txt", "new content");
                     require(written.ok(), written.error());
                     require(outside.read("victim.txt") == "original",
                             "file behind the planted link must be untouched");
                     require(root.read("a.txt") == "new content", "target written");
                   }});

  tests.push_back({"write_file_atomic_refuses_symlink_target", [] {
                     crucible::testing::TempWorkspace root;
                     crucible::testing::TempWorkspace outside;
                     outside.create_file("victim.txt", "original");
                     std::filesystem::create_symlink(outside.path() / "victim.txt", root.path() / "a.txt");
                     const auto written = common::write_file_atomic(root.path() / "a.txt", "x");
                     require(!written.ok() && written.kind() == common::ErrorKind::PathSecurity,
                             "symlink target refused");
                     require(outside.read("victim.txt") == "original", "link target untouched");
                   }});

  tests.push_back({"copy_tree_replaces_planted_links", [] {
                     crucible::testing::TempWorkspace source;
                     crucible::testing::TempWorkspace target;
                     crucible::testing::TempWorkspace outside;
                     outside.create_file("victim.txt", "original");
                     std::filesystem::create_directories(outside.path() / "dir");
                     source.create_file("main.py", "print app");
                     source.create_file("lib/util.py", "x = 1");
                     std::filesystem::create_symlink(outside.path() / "victim.txt",
                                                     target.path() / "main.py");
                     std::filesystem::create_directory_symlink(outside.path() / "dir",
                                                               target.path() / "lib");

                     const auto copied = common::copy_tree_no_follow(source.path(), target.path());
                     require(copied.ok(), copied.error());
                     require(outside.read("victim.txt") == "original", "file link not followed");
                     require(!std::filesystem::exists(outside.path() / "dir" / "util.py"),
                             "directory link not followed");
                     require(!std::filesystem::is_symlink(target.path() / "main.py") &&
                                 target.read("main.py") == "print app",
                             "link replaced by the real file");
                     require(target.read("lib/util.py") == "x = 1", "nested file copied");
                   }});

  tests.push_back({"clear_directory_keeps_directory", [] {
                     crucible::testing::TempWorkspace workspace;
                     workspace.create_file("a.txt", "a");
                     workspace.create_file("sub/b.txt", "b");
                     const auto cleared = common::clear_directory(workspace.path());
                     require(cleared.ok(), cleared.error());
                     require(std::filesystem::exists(workspace.path()), "directory should remain");
                     require(std::filesystem::is_empty(workspace.path()), "directory should be empty");
                   }});

  tests.push_back({"cancellation_token_copies_share_state", [] {
                     common::CancellationToken token;
                     const common::CancellationToken copy = token;
                     require(!copy.is_cancelled(), "fresh token should not be cancelled");
                     token.cancel();
                     require(copy.is_cancelled(), "copy should observe cancellation");
                     require(copy.flag()->load(), "flag should be set");
                   }});
}
