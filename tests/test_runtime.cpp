#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <memory>
#include <system_error>
#include <thread>
#include "fake_runtime.hpp"
#include "runtime/file_transfer.hpp"
#include "runtime/interpreter.hpp"
#include "runtime/package_cache.hpp"
#include "runtime/sandbox.hpp"
#include "runtime/tar_archive.hpp"
#include "runtime/templates.hpp"
#include "util/errors.hpp"
#include "util/ids.hpp"

using namespace warden;
using namespace warden::runtime;
using warden::testing::FakeContainerRuntime;

// ============================================================================
// Path validation
// ============================================================================

TEST(PathValidatorTest, NormalizesRelativePaths) {
    EXPECT_EQ(PathValidator::validate("data.csv"), "data.csv");
    EXPECT_EQ(PathValidator::validate("./dir/./file.txt"), "dir/file.txt");
    EXPECT_EQ(PathValidator::validate("a//b.json"), "a/b.json");
}

TEST(PathValidatorTest, RejectsEscapes) {
    EXPECT_THROW(PathValidator::validate(""), PathSecurityError);
    EXPECT_THROW(PathValidator::validate("/etc/passwd"), PathSecurityError);
    EXPECT_THROW(PathValidator::validate("../secret"), PathSecurityError);
    EXPECT_THROW(PathValidator::validate("a/../../b"), PathSecurityError);
    EXPECT_THROW(PathValidator::validate(std::string("a\0b", 3)), PathSecurityError);
    EXPECT_THROW(PathValidator::validate("space name.txt"), PathSecurityError);
    EXPECT_THROW(PathValidator::validate("./"), PathSecurityError);
}

TEST(PathValidatorTest, DangerousExtensions) {
    EXPECT_THROW(PathValidator::validate("run.sh"), PathSecurityError);
    EXPECT_THROW(PathValidator::validate("lib/evil.SO"), PathSecurityError);
    EXPECT_EQ(PathValidator::validate("main.sh", true), "main.sh");
    EXPECT_FALSE(PathValidator::has_dangerous_extension(".bashrc"));
    EXPECT_TRUE(PathValidator::is_safe("notes.md"));
    EXPECT_FALSE(PathValidator::is_safe("module.pyc"));
}

// ============================================================================
// Tar codec
// ============================================================================

TEST(TarArchiveTest, WritesParentDirectoriesFirst) {
    std::string tar = write_tar({{"dir/sub/file.txt", "hello"}}, TarOptions{});
    ASSERT_EQ(tar.size() % 512, 0u);

    // dir/ header, dir/sub/ header, file header + one data block, two end blocks
    EXPECT_EQ(tar.size(), 512u * 6);
    EXPECT_EQ(tar.substr(0, 4), "dir/");
    EXPECT_EQ(tar[156], '5');
    EXPECT_EQ(tar.substr(257, 5), "ustar");

    TarFile file = read_first_file(tar.substr(1024), 1024);
    EXPECT_EQ(file.name, "dir/sub/file.txt");
    EXPECT_EQ(file.content, "hello");
}

TEST(TarArchiveTest, DirectoryFirstMemberIsNotAFile) {
    // The stream for a directory starts with the directory itself
    std::string tar = write_tar({{"d/inner.txt", "secret"}});
    try {
        read_first_file(tar, 1024);
        FAIL() << "directory stream read as a file";
    } catch (const NotAFileError& e) {
        EXPECT_STREQ(e.kind(), "not_a_file");
        EXPECT_NE(std::string(e.what()).find("d/"), std::string::npos);
    }
}

TEST(TarArchiveTest, PaxHeaderBeforeFileIsSkipped) {
    std::string plain = write_tar({{"a.txt", "body"}});
    // Reuse the ustar header as a pax extended header with no payload
    std::string pax = plain.substr(0, 512);
    pax[156] = 'x';
    pax.replace(124, 11, "00000000000");
    TarFile file = read_first_file(pax + plain, 1024);
    EXPECT_EQ(file.name, "a.txt");
    EXPECT_EQ(file.content, "body");
}

TEST(TarArchiveTest, OwnershipFromOptions) {
    TarOptions options;
    options.uid = 1000;
    options.gid = 1000;
    std::string tar = write_tar({{"a.txt", "x"}}, options);
    EXPECT_EQ(tar.substr(108, 7), "0001750");   // 1000 in octal
    EXPECT_EQ(tar.substr(116, 7), "0001750");
}

TEST(TarArchiveTest, SizeLimitCheckedBeforeCopy) {
    std::string tar = write_tar({{"big.bin", std::string(2048, 'x')}});
    EXPECT_THROW(read_first_file(tar, 1024), FileSizeError);
}

TEST(TarArchiveTest, MalformedArchives) {
    EXPECT_THROW(read_first_file(std::string(1024, '\0'), 100), Error);

    std::string tar = write_tar({{"a.txt", std::string(600, 'y')}});
    EXPECT_THROW(read_first_file(tar.substr(0, 700), 1000), Error);
}

// ============================================================================
// Templates
// ============================================================================

TEST(TemplateRegistryTest, BuiltinsPresent) {
    TemplateRegistry registry;
    for (const char* name : {"default", "python-data", "python-ml", "python-web",
                             "node-basic", "minimal", "go-basic", "rust-basic", "java-basic"}) {
        EXPECT_TRUE(registry.get(name).has_value()) << name;
        EXPECT_TRUE(registry.is_builtin(name)) << name;
    }
    EXPECT_EQ(registry.list().size(), 9u);
}

TEST(TemplateRegistryTest, SandboxConfigFromTemplate) {
    TemplateRegistry registry;
    SandboxConfig web = registry.sandbox_config("python-web");
    EXPECT_TRUE(web.network_enabled);
    EXPECT_EQ(web.timeout_seconds, 60.0);

    SandboxConfig ml = registry.sandbox_config("python-ml");
    EXPECT_EQ(ml.memory_limit, "2g");
    EXPECT_EQ(ml.cpu_quota, 200000);
    EXPECT_EQ(ml.environment.at("HF_HOME"), "/tmp/huggingface");

    SandboxConfig fallback = registry.sandbox_config("does-not-exist");
    EXPECT_EQ(fallback.image, "executor-sandbox:latest");
    EXPECT_FALSE(fallback.network_enabled);
}

TEST(TemplateRegistryTest, ValidationRules) {
    SandboxTemplate t;
    t.name = "custom";
    t.base_image = "python:3.12";
    EXPECT_TRUE(TemplateRegistry::validate(t).empty());

    t.memory_limit = "lots";
    t.timeout = 0;
    t.cpu_quota = 0;
    EXPECT_EQ(TemplateRegistry::validate(t).size(), 3u);

    EXPECT_EQ(parse_memory_limit("512m"), 512ULL * 1024 * 1024);
    EXPECT_EQ(parse_memory_limit("2G"), 2ULL * 1024 * 1024 * 1024);
    EXPECT_FALSE(parse_memory_limit("2T").has_value());
}

TEST(TemplateRegistryTest, BuiltinsCannotBeUnregistered) {
    TemplateRegistry registry;
    SandboxTemplate t;
    t.name = "custom";
    t.base_image = "python:3.12";
    ASSERT_TRUE(registry.register_template(t));
    EXPECT_FALSE(registry.is_builtin("custom"));
    EXPECT_TRUE(registry.unregister_template("custom"));
    EXPECT_FALSE(registry.unregister_template("custom"));
    EXPECT_FALSE(registry.unregister_template("default"));
}

TEST(TemplateRegistryTest, LoadFileSkipsInvalidEntries) {
    std::string path = ::testing::TempDir() + "warden_templates.json";
    {
        std::ofstream out(path);
        out << R"({
            "scipy-lab": {"base_image": "python:3.12", "timeout": 90, "packages": ["scipy"]},
            "broken": {"description": "no image"},
            "too-slow": {"base_image": "python:3.12", "timeout": 99999}
        })";
    }

    TemplateRegistry registry;
    EXPECT_EQ(registry.load_file(path), 1u);
    auto loaded = registry.get("scipy-lab");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->timeout, 90);
    EXPECT_FALSE(registry.get("broken").has_value());

    EXPECT_EQ(registry.load_file(path + ".missing"), 0u);
}

// ============================================================================
// Sandbox
// ============================================================================

class SandboxTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeContainerRuntime> runtime = std::make_shared<FakeContainerRuntime>();

    SandboxConfig config() {
        SandboxConfig c;
        c.name = "sandbox-test";
        c.timeout_seconds = 5.0;
        return c;
    }
};

TEST_F(SandboxTest, ContainerSpecIsLockedDown) {
    Sandbox sandbox(config(), runtime);
    ContainerSpec spec = sandbox.container_spec();
    EXPECT_TRUE(spec.read_only_root);
    EXPECT_FALSE(spec.network_enabled);
    EXPECT_EQ(spec.cap_drop, std::vector<std::string>{"ALL"});
    EXPECT_EQ(spec.security_opts, std::vector<std::string>{"no-new-privileges:true"});
    ASSERT_EQ(spec.tmpfs.size(), 2u);
    EXPECT_EQ(spec.tmpfs[0].path, "/tmp");
    EXPECT_NE(spec.tmpfs[0].options.find("noexec"), std::string::npos);
    EXPECT_EQ(spec.tmpfs[1].path, "/workspace");
    EXPECT_TRUE(spec.dns.empty());
    EXPECT_EQ(spec.user, "sandbox");
}

TEST_F(SandboxTest, NetworkEnabledAddsResolvers) {
    SandboxConfig c = config();
    c.network_enabled = true;
    c.environment["EXTRA"] = "1";
    Sandbox sandbox(c, runtime);
    ContainerSpec spec = sandbox.container_spec();
    EXPECT_EQ(spec.dns.size(), 2u);
    EXPECT_EQ(spec.environment.at("EXTRA"), "1");
    EXPECT_EQ(spec.environment.at("PYTHONUNBUFFERED"), "1");
}

TEST_F(SandboxTest, RunRequiresCreate) {
    Sandbox sandbox(config(), runtime);
    EXPECT_EQ(sandbox.state(), SandboxState::UNCREATED);
    EXPECT_THROW(sandbox.run("print(1)", "python"), SandboxStateError);
    EXPECT_THROW(sandbox.write_file("a.txt", "x"), SandboxStateError);
}

TEST_F(SandboxTest, RunUploadsSourceAndExecutes) {
    runtime->set_exec_handler([](const std::vector<std::string>& argv) {
        return ExecOutput{0, "hello " + argv[1] + "\n", ""};
    });

    Sandbox sandbox(config(), runtime);
    sandbox.create();
    ASSERT_EQ(sandbox.state(), SandboxState::RUNNING);

    ExecutionResult result = sandbox.run("print('hello')", "  Python ", {{"data.csv", "a,b"}});
    EXPECT_TRUE(result.ok());
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.stdout_text, "hello main.py\n");
    EXPECT_EQ(result.container_id, "ctr-1");

    ASSERT_EQ(runtime->archives.size(), 1u);
    EXPECT_EQ(runtime->archives[0].first, "/workspace");
    TarFile first = read_first_file(runtime->archives[0].second, 1024);
    EXPECT_EQ(first.name, "data.csv");

    ASSERT_EQ(runtime->exec_calls.size(), 1u);
    EXPECT_EQ(runtime->exec_calls[0], (std::vector<std::string>{"python", "main.py"}));
    EXPECT_EQ(runtime->last_exec_options.user, "sandbox");
}

TEST_F(SandboxTest, NonZeroExitIsErrorWithSanitizedOutput) {
    runtime->set_exec_handler([](const std::vector<std::string>&) {
        return ExecOutput{1, "bad \xFF byte", "Traceback"};
    });
    Sandbox sandbox(config(), runtime);
    sandbox.create();

    ExecutionResult result = sandbox.run("raise SystemExit(1)", "python");
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_EQ(result.stdout_text, "bad \xEF\xBF\xBD byte");
    EXPECT_EQ(result.stderr_text, "Traceback");
}

TEST_F(SandboxTest, UnsupportedLanguageTouchesNothing) {
    Sandbox sandbox(config(), runtime);
    sandbox.create();
    EXPECT_THROW(sandbox.run("x", "cobol"), UnsupportedLanguageError);
    EXPECT_TRUE(runtime->archives.empty());
    EXPECT_TRUE(runtime->exec_calls.empty());
}

TEST_F(SandboxTest, LaunchPlans) {
    EXPECT_EQ(launch_plan_for("JS").source_file, "main.js");
    EXPECT_EQ(launch_plan_for("bash").source_file, "main.sh");
    EXPECT_EQ(launch_plan_for("java").source_file, "Main.java");
    EXPECT_THROW(launch_plan_for(""), UnsupportedLanguageError);
}

TEST_F(SandboxTest, RejectedFilesNeverUploaded) {
    Sandbox sandbox(config(), runtime);
    sandbox.create();
    EXPECT_THROW(sandbox.run("x", "python", {{"../escape.txt", "x"}}), PathSecurityError);
    EXPECT_THROW(sandbox.write_file("payload.exe", "MZ"), PathSecurityError);

    SandboxConfig small = config();
    small.name = "sandbox-small";
    small.limits.max_file_size = 4;
    Sandbox limited(small, runtime);
    limited.create();
    EXPECT_THROW(limited.write_file("big.txt", "12345"), FileSizeError);

    EXPECT_TRUE(runtime->archives.empty());
}

TEST_F(SandboxTest, TimeoutDestroysSandbox) {
    runtime->hang_exec = true;
    SandboxConfig c = config();
    c.timeout_seconds = 0.2;
    Sandbox sandbox(c, runtime);
    sandbox.create();

    EXPECT_THROW(sandbox.run("while True: pass", "python"), TimeoutError);
    EXPECT_DOUBLE_EQ(runtime->last_exec_options.timeout_seconds, 0.2);
    EXPECT_EQ(sandbox.state(), SandboxState::DESTROYED);
    EXPECT_EQ(runtime->removed_count(), 1u);
    EXPECT_THROW(sandbox.run("print(1)", "python"), SandboxStateError);
    EXPECT_THROW(sandbox.create(), SandboxStateError);
}

TEST_F(SandboxTest, ReadFileDetectsBinary) {
    Sandbox sandbox(config(), runtime);
    sandbox.create();
    runtime->stored_files["/workspace/out.txt"] = "result";
    runtime->stored_files["/workspace/plot.png"] = std::string("\x89PNG\xFF", 5);

    auto text = sandbox.read_file("out.txt");
    ASSERT_TRUE(text.has_value());
    EXPECT_FALSE(text->is_binary);
    EXPECT_EQ(text->content, "result");

    auto binary = sandbox.read_file("plot.png");
    ASSERT_TRUE(binary.has_value());
    EXPECT_TRUE(binary->is_binary);
    EXPECT_EQ(binary->to_json()["encoding"], "base64");

    EXPECT_FALSE(sandbox.read_file("missing.txt").has_value());
    EXPECT_THROW(sandbox.read_file("/etc/shadow"), PathSecurityError);
}

TEST_F(SandboxTest, ReadFileOnDirectoryFails) {
    Sandbox sandbox(config(), runtime);
    sandbox.create();
    runtime->stored_dirs["/workspace/d"] = {"inner.txt", "secret"};
    EXPECT_THROW(sandbox.read_file("d"), NotAFileError);
    EXPECT_EQ(sandbox.state(), SandboxState::RUNNING);
}

TEST_F(SandboxTest, SetupFailureTearsDown) {
    SandboxConfig c = config();
    c.setup_commands = {"pip install nothing"};
    runtime->set_exec_handler([](const std::vector<std::string>&) {
        return ExecOutput{1, "", "no such package"};
    });

    Sandbox sandbox(c, runtime);
    EXPECT_THROW(sandbox.create(), ProvisionError);
    EXPECT_EQ(sandbox.state(), SandboxState::DESTROYED);
    EXPECT_EQ(runtime->live_count(), 0u);
}

TEST_F(SandboxTest, NonErrorDuringSetupStillTearsDown) {
    SandboxConfig c = config();
    c.setup_commands = {"true"};
    runtime->set_exec_handler([](const std::vector<std::string>&) -> ExecOutput {
        throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again));
    });

    Sandbox sandbox(c, runtime);
    EXPECT_THROW(sandbox.create(), std::system_error);
    EXPECT_EQ(sandbox.state(), SandboxState::DESTROYED);
    EXPECT_EQ(runtime->live_count(), 0u);
}

TEST_F(SandboxTest, ProvisionFailurePropagates) {
    runtime->fail_create = true;
    Sandbox sandbox(config(), runtime);
    EXPECT_THROW(sandbox.create(), ProvisionError);
    EXPECT_EQ(sandbox.state(), SandboxState::UNCREATED);
}

TEST_F(SandboxTest, ScopedSandboxAlwaysDestroys) {
    Sandbox sandbox(config(), runtime);
    {
        ScopedSandbox scoped(sandbox);
        EXPECT_EQ(scoped->state(), SandboxState::RUNNING);
    }
    EXPECT_EQ(sandbox.state(), SandboxState::DESTROYED);
    EXPECT_EQ(runtime->live_count(), 0u);

    // Destroy is idempotent
    sandbox.destroy();
    EXPECT_EQ(runtime->removed_count(), 1u);
}

TEST_F(SandboxTest, InstallPackages) {
    Sandbox sandbox(config(), runtime);
    sandbox.create();
    EXPECT_TRUE(sandbox.install_packages({}).ok());
    EXPECT_TRUE(runtime->exec_calls.empty());

    EXPECT_TRUE(sandbox.install_packages({"requests"}).ok());
    ASSERT_EQ(runtime->exec_calls.size(), 1u);
    EXPECT_EQ(runtime->exec_calls[0].front(), "pip");
    EXPECT_EQ(runtime->exec_calls[0].back(), "requests");
}

// ============================================================================
// Workspace management
// ============================================================================

TEST_F(SandboxTest, CreateDirectoryRunsMkdirAsSandboxUser) {
    Sandbox sandbox(config(), runtime);
    sandbox.create();

    FileOperation made = sandbox.create_directory("./out/plots");
    EXPECT_TRUE(made.success);
    EXPECT_EQ(made.path, "out/plots");
    ASSERT_EQ(runtime->exec_calls.size(), 1u);
    EXPECT_EQ(runtime->exec_calls[0],
              (std::vector<std::string>{"mkdir", "-p", "--", "/workspace/out/plots"}));
    EXPECT_EQ(runtime->last_exec_options.user, "sandbox");

    runtime->set_exec_handler([](const std::vector<std::string>&) {
        return ExecOutput{1, "", "mkdir: cannot create directory: File exists\n"};
    });
    FileOperation clash = sandbox.create_directory("out");
    EXPECT_FALSE(clash.success);
    EXPECT_EQ(clash.error, "mkdir failed: mkdir: cannot create directory: File exists");
    EXPECT_EQ(clash.to_json()["success"], false);

    EXPECT_THROW(sandbox.create_directory("../up"), PathSecurityError);
}

TEST(DirectoryListingTest, ParsesLsOutput) {
    std::string listing =
        "total 16\n"
        "drwxr-xr-x 3 sandbox sandbox  80 Oct 18 10:00 .\n"
        "drwxr-xr-x 1 root    root    4096 Oct 18 09:59 ..\n"
        "-rw-r--r-- 1 sandbox sandbox   12 Oct 18 10:00 .hidden\n"
        "-rw-r--r-- 1 sandbox sandbox 2048 Oct 18 10:00 data set.csv\n"
        "drwxr-xr-x 2 sandbox sandbox   40 Oct 18 10:00 out\n"
        "lrwxrwxrwx 1 sandbox sandbox    7 Oct 18 10:00 latest -> out/a.png\n";

    auto visible = parse_directory_listing(listing, false);
    ASSERT_EQ(visible.size(), 3u);
    EXPECT_EQ(visible[0].name, "data set.csv");
    EXPECT_EQ(visible[0].type, "file");
    EXPECT_EQ(visible[0].size, 2048u);
    EXPECT_EQ(visible[0].owner, "sandbox");
    EXPECT_EQ(visible[1].name, "out");
    EXPECT_EQ(visible[1].type, "directory");
    EXPECT_EQ(visible[1].permissions, "drwxr-xr-x");
    EXPECT_EQ(visible[2].name, "latest");

    auto all = parse_directory_listing(listing, true);
    ASSERT_EQ(all.size(), 4u);
    EXPECT_EQ(all[0].name, ".hidden");
    EXPECT_EQ(all[0].to_json()["size"], 12);
}

TEST_F(SandboxTest, ListDirectoryDefaultsToWorkspaceRoot) {
    runtime->set_exec_handler([](const std::vector<std::string>& argv) {
        if (argv.back() == "/workspace/missing") {
            return ExecOutput{2, "", "ls: cannot access"};
        }
        return ExecOutput{0, "total 4\n-rw-r--r-- 1 sandbox sandbox 5 Oct 18 10:00 a.txt\n", ""};
    });
    Sandbox sandbox(config(), runtime);
    sandbox.create();

    auto root = sandbox.list_directory();
    ASSERT_TRUE(root.has_value());
    ASSERT_EQ(root->size(), 1u);
    EXPECT_EQ(root->front().name, "a.txt");
    EXPECT_EQ(runtime->exec_calls.back(), (std::vector<std::string>{"ls", "-la", "--", "/workspace"}));

    ASSERT_TRUE(sandbox.list_directory("sub").has_value());
    EXPECT_EQ(runtime->exec_calls.back().back(), "/workspace/sub");

    EXPECT_FALSE(sandbox.list_directory("missing").has_value());
    EXPECT_THROW(sandbox.list_directory("/etc"), PathSecurityError);
}

TEST_F(SandboxTest, RemovePathHonoursRecursiveFlag) {
    Sandbox sandbox(config(), runtime);
    sandbox.create();

    EXPECT_TRUE(sandbox.remove_path("old.txt").success);
    EXPECT_EQ(runtime->exec_calls.back(),
              (std::vector<std::string>{"rm", "--", "/workspace/old.txt"}));

    // Files written by the launcher may carry script extensions
    EXPECT_TRUE(sandbox.remove_path("main.sh").success);

    EXPECT_TRUE(sandbox.remove_path("out", true).success);
    EXPECT_EQ(runtime->exec_calls.back(),
              (std::vector<std::string>{"rm", "-r", "--", "/workspace/out"}));

    runtime->set_exec_handler([](const std::vector<std::string>&) {
        return ExecOutput{1, "", "rm: cannot remove 'out': Is a directory\n"};
    });
    FileOperation refused = sandbox.remove_path("out");
    EXPECT_FALSE(refused.success);
    EXPECT_EQ(refused.error, "rm: cannot remove 'out': Is a directory");

    EXPECT_THROW(sandbox.remove_path(""), PathSecurityError);
    EXPECT_THROW(sandbox.remove_path("."), PathSecurityError);
}

TEST_F(SandboxTest, StorageUsageFromDu) {
    runtime->set_exec_handler([](const std::vector<std::string>& argv) {
        EXPECT_EQ(argv, (std::vector<std::string>{"du", "-sb", "/workspace"}));
        return ExecOutput{0, "40960\t/workspace\n", ""};
    });
    Sandbox sandbox(config(), runtime);
    sandbox.create();
    EXPECT_EQ(sandbox.storage_usage(), 40960u);

    runtime->set_exec_handler([](const std::vector<std::string>&) {
        return ExecOutput{1, "", "du: permission denied"};
    });
    EXPECT_EQ(sandbox.storage_usage(), 0u);

    runtime->set_exec_handler([](const std::vector<std::string>&) {
        return ExecOutput{0, "garbage", ""};
    });
    EXPECT_EQ(sandbox.storage_usage(), 0u);
}

TEST_F(SandboxTest, BatchWriteUploadsAcceptedFilesOnce) {
    SandboxConfig c = config();
    c.limits.max_file_size = 8;
    Sandbox sandbox(c, runtime);
    sandbox.create();

    BatchWriteResult batch = sandbox.batch_write({
        {"./a.txt", "alpha"},
        {"b/c.json", "{}"},
        {"../escape.txt", "x"},
        {"tool.exe", "MZ"},
        {"big.txt", "123456789"},
    });
    EXPECT_TRUE(batch.success);
    EXPECT_EQ(batch.total_files, 5u);
    EXPECT_EQ(batch.successful, 2u);
    EXPECT_TRUE(batch.results.at("a.txt").success);
    EXPECT_TRUE(batch.results.at("b/c.json").success);
    EXPECT_FALSE(batch.results.at("../escape.txt").success);
    EXPECT_FALSE(batch.results.at("tool.exe").success);
    EXPECT_FALSE(batch.results.at("big.txt").success);

    ASSERT_EQ(runtime->archives.size(), 1u);
    EXPECT_EQ(runtime->archives[0].first, "/workspace");
    EXPECT_EQ(batch.to_json()["successful"], 2);
}

TEST_F(SandboxTest, BatchWriteOverTotalLimitUploadsNothing) {
    SandboxConfig c = config();
    c.limits.max_total_size = 10;
    Sandbox sandbox(c, runtime);
    sandbox.create();

    BatchWriteResult batch = sandbox.batch_write({{"a.txt", "123456"}, {"b.txt", "123456"}});
    EXPECT_FALSE(batch.success);
    EXPECT_EQ(batch.error, "Batch size 12 exceeds limit 10");
    EXPECT_TRUE(batch.results.empty());
    EXPECT_TRUE(runtime->archives.empty());
}

TEST_F(SandboxTest, BatchWriteUploadFailureMarksEntries) {
    runtime->fail_upload = true;
    Sandbox sandbox(config(), runtime);
    sandbox.create();

    BatchWriteResult batch = sandbox.batch_write({{"a.txt", "x"}});
    EXPECT_FALSE(batch.success);
    EXPECT_EQ(batch.successful, 0u);
    EXPECT_FALSE(batch.results.at("a.txt").success);
    EXPECT_EQ(batch.error, "Failed to upload batch to container");
}

TEST_F(SandboxTest, WorkspaceOperationsNeedRunningSandbox) {
    Sandbox sandbox(config(), runtime);
    EXPECT_THROW(sandbox.create_directory("out"), SandboxStateError);
    EXPECT_THROW(sandbox.list_directory(), SandboxStateError);
    EXPECT_THROW(sandbox.remove_path("a.txt"), SandboxStateError);
    EXPECT_THROW(sandbox.storage_usage(), SandboxStateError);
    EXPECT_THROW(sandbox.batch_write({{"a.txt", "x"}}), SandboxStateError);
}

// ============================================================================
// Code interpreter
// ============================================================================

namespace {

std::string uploaded_source(const FakeContainerRuntime& runtime) {
    return read_first_file(runtime.archives.back().second, 1024 * 1024).content;
}

} // namespace

TEST(CodeInterpreterTest, SplitsPythonTraceback) {
    std::string stderr_text =
        "warming up\n"
        "Traceback (most recent call last):\n"
        "  File \"main.py\", line 3, in <module>\n"
        "ZeroDivisionError: division by zero\n";
    auto [message, traceback] = CodeInterpreter::split_traceback(stderr_text);
    EXPECT_EQ(message, "ZeroDivisionError: division by zero");
    EXPECT_EQ(traceback.rfind("Traceback (most recent call last):", 0), 0u);
    EXPECT_EQ(traceback.back(), 'o');

    auto plain = CodeInterpreter::split_traceback("segfault");
    EXPECT_EQ(plain.first, "segfault");
    EXPECT_TRUE(plain.second.empty());
}

TEST_F(SandboxTest, InterpreterCollectsFigures) {
    runtime->set_exec_handler([](const std::vector<std::string>& argv) {
        if (argv.front() == "ls") {
            return ExecOutput{0,
                "total 12\n"
                "drwxr-xr-x 2 sandbox sandbox 80 Oct 18 10:00 .\n"
                "-rw-r--r-- 1 sandbox sandbox  5 Oct 18 10:00 plot_0.png\n"
                "-rw-r--r-- 1 sandbox sandbox 11 Oct 18 10:00 plotly_chart_1.json\n"
                "-rw-r--r-- 1 sandbox sandbox  3 Oct 18 10:00 notes.txt\n", ""};
        }
        return ExecOutput{0, "drawn\n", ""};
    });
    Sandbox sandbox(config(), runtime);
    sandbox.create();
    std::string png("\x89PNG\xFF", 5);
    runtime->stored_files["/workspace/.artifacts/plot_0.png"] = png;
    runtime->stored_files["/workspace/.artifacts/plotly_chart_1.json"] = R"({"data":[]})";
    runtime->stored_files["/workspace/.artifacts/notes.txt"] = "n/a";

    CodeInterpreter interpreter(sandbox);
    InterpreterResult result = interpreter.run("plt.plot([1, 2]); plt.show()");
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.execution.stdout_text, "drawn\n");

    std::string source = uploaded_source(*runtime);
    EXPECT_NE(source.find("plt.plot([1, 2]); plt.show()"), std::string::npos);
    EXPECT_NE(source.find("_warden_save_figures()"), std::string::npos);
    EXPECT_EQ(runtime->exec_calls.back(),
              (std::vector<std::string>{"ls", "-la", "--", "/workspace/.artifacts"}));

    ASSERT_EQ(result.artifacts.size(), 2u);
    EXPECT_EQ(result.artifacts[0].type, "image/png");
    EXPECT_EQ(result.artifacts[0].name, "plot_0.png");
    EXPECT_EQ(result.artifacts[0].content.get<std::string>(), util::base64_encode(png));
    EXPECT_EQ(result.artifacts[0].metadata["source"], "matplotlib");
    EXPECT_EQ(result.artifacts[0].metadata["encoding"], "base64");
    EXPECT_EQ(result.artifacts[1].type, "chart");
    EXPECT_EQ(result.artifacts[1].name, "plotly_chart_1");
    EXPECT_TRUE(result.artifacts[1].content["data"].is_array());

    nlohmann::json j = result.to_json();
    EXPECT_EQ(j["artifacts"].size(), 2u);
    EXPECT_TRUE(j["error_message"].is_null());
}

TEST_F(SandboxTest, InterpreterReportsTraceback) {
    runtime->set_exec_handler([](const std::vector<std::string>&) {
        return ExecOutput{1, "", "Traceback (most recent call last):\n  File \"main.py\"\nValueError: bad\n"};
    });
    Sandbox sandbox(config(), runtime);
    sandbox.create();

    InterpreterResult result = CodeInterpreter(sandbox).run("raise ValueError('bad')");
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.error_message, "ValueError: bad");
    ASSERT_EQ(result.artifacts.size(), 1u);
    EXPECT_EQ(result.artifacts[0].type, "error");
    EXPECT_EQ(result.artifacts[0].name, "execution_error");
    EXPECT_EQ(result.artifacts[0].content["message"], "ValueError: bad");
    EXPECT_EQ(result.artifacts[0].metadata["exit_code"], 1);

    // No artifact listing after a failed run
    ASSERT_EQ(runtime->exec_calls.size(), 1u);
}

TEST_F(SandboxTest, InterpreterLeavesOtherLanguagesAlone) {
    Sandbox sandbox(config(), runtime);
    sandbox.create();

    InterpreterResult result = CodeInterpreter(sandbox).run("console.log(1)", "node");
    EXPECT_TRUE(result.ok());
    EXPECT_TRUE(result.artifacts.empty());
    EXPECT_EQ(uploaded_source(*runtime), "console.log(1)");
    ASSERT_EQ(runtime->exec_calls.size(), 1u);
    EXPECT_EQ(runtime->exec_calls[0].front(), "node");

    EXPECT_THROW(CodeInterpreter(sandbox).run("x", "cobol"), UnsupportedLanguageError);
}

TEST_F(SandboxTest, InterpreterPlotlyCapturesShow) {
    Sandbox sandbox(config(), runtime);
    sandbox.create();

    InterpreterResult result = CodeInterpreter(sandbox).run_plotly("fig.show()");
    EXPECT_TRUE(result.ok());
    std::string source = uploaded_source(*runtime);
    EXPECT_NE(source.find("_warden_go.Figure.show = _warden_show"), std::string::npos);
    EXPECT_NE(source.find("_warden_save_figures()"), std::string::npos);
    EXPECT_LT(source.find("_warden_go.Figure.show"), source.find("fig.show()"));
}

// ============================================================================
// Package cache
// ============================================================================

class PackageCacheTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = std::filesystem::path(::testing::TempDir()) / ("warden_pkg_" + util::random_hex(6));
    }
    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }

    std::filesystem::path dir;
    util::Clock clock = []() { return 1700000000.0; };
};

TEST_F(PackageCacheTest, KeyIgnoresOrder) {
    std::string key = PackageCache::cache_key({"pandas", "numpy"});
    EXPECT_EQ(key.size(), 16u);
    EXPECT_EQ(key, PackageCache::cache_key({"numpy", "pandas"}));
    EXPECT_NE(key, PackageCache::cache_key({"numpy", "pandas"}, "node"));
    EXPECT_NE(key, PackageCache::cache_key({"numpy"}));
}

TEST_F(PackageCacheTest, RegisterPersistsAcrossInstances) {
    std::string key;
    {
        PackageCache cache(dir, clock);
        EXPECT_TRUE(cache.is_cached({}));
        EXPECT_FALSE(cache.is_cached({"numpy"}));
        EXPECT_FALSE(cache.cache_path({"numpy"}).has_value());

        key = cache.register_cache({"numpy"}, "python", "ctr-9", 2048);
        EXPECT_TRUE(cache.is_cached({"numpy"}));
        auto path = cache.cache_path({"numpy"});
        ASSERT_TRUE(path.has_value());
        EXPECT_EQ(*path, dir / key);
    }

    PackageCache reopened(dir, clock);
    EXPECT_TRUE(reopened.is_cached({"numpy"}));
    EXPECT_EQ(reopened.size(), 1u);

    std::ofstream(dir / key / "wheel.whl") << "0123456789";
    nlohmann::json stats = reopened.stats();
    EXPECT_EQ(stats["entry_count"], 1);
    EXPECT_EQ(stats["total_size_bytes"], 10);
    EXPECT_EQ(stats["cache_dir"], dir.string());
}

TEST_F(PackageCacheTest, MissingDirectoryIsNotCached) {
    PackageCache cache(dir, clock);
    std::string key = cache.register_cache({"requests"});
    std::filesystem::remove_all(dir / key);
    EXPECT_FALSE(cache.is_cached({"requests"}));
}

TEST_F(PackageCacheTest, InvalidateAndClear) {
    PackageCache cache(dir, clock);
    std::string first = cache.register_cache({"numpy"});
    cache.register_cache({"lodash"}, "node");

    EXPECT_TRUE(cache.invalidate(first));
    EXPECT_FALSE(cache.is_cached({"numpy"}));
    EXPECT_FALSE(std::filesystem::exists(dir / first));
    EXPECT_FALSE(cache.invalidate("../../etc"));

    EXPECT_TRUE(cache.clear());
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_FALSE(cache.is_cached({"lodash"}, "node"));
    EXPECT_TRUE(std::filesystem::exists(dir / "cache-metadata.json"));
}

TEST_F(PackageCacheTest, CorruptMetadataStartsEmpty) {
    std::filesystem::create_directories(dir);
    std::ofstream(dir / "cache-metadata.json") << "{not json";
    PackageCache cache(dir, clock);
    EXPECT_EQ(cache.size(), 0u);
}
