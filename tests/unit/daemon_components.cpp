#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <memory>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "bucketsync/daemon/cancellation.hpp"
#include "bucketsync/daemon/config.hpp"
#include "bucketsync/daemon/daemon.hpp"
#include "bucketsync/daemon/download_loop.hpp"
#include "bucketsync/daemon/notifier.hpp"
#include "bucketsync/daemon/progress.hpp"
#include "bucketsync/daemon/upload_loop.hpp"
#include "bucketsync/error_codes.hpp"
#include "bucketsync/history_ledger.hpp"
#include "bucketsync/local_blob_store.hpp"

using namespace bucketsync;
using namespace bucketsync::daemon;

namespace
{

    std::filesystem::path fresh_dir(const std::string &name)
    {
        const auto path = std::filesystem::temp_directory_path() / name;
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
        std::filesystem::create_directories(path);
        return path;
    }

    void write_file(const std::filesystem::path &path, const std::string &content)
    {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << content;
    }

    std::string read_file(const std::filesystem::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        std::ostringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }

    std::size_t count_files(const std::filesystem::path &dir)
    {
        std::size_t count = 0;
        for (const auto &entry : std::filesystem::directory_iterator(dir))
        {
            if (entry.is_regular_file())
            {
                ++count;
            }
        }
        return count;
    }

    // A directory in place of the ledger's temp file makes every save() fail.
    std::filesystem::path ledger_temp_path(const HistoryLedger &ledger)
    {
        auto temp = ledger.path();
        temp += ".part";
        return temp;
    }

    void block_ledger_writes(const HistoryLedger &ledger)
    {
        std::filesystem::create_directories(ledger_temp_path(ledger) / "blocker");
    }

    void unblock_ledger_writes(const HistoryLedger &ledger)
    {
        std::filesystem::remove_all(ledger_temp_path(ledger));
    }

    // Local store that counts transfers and fails on demand.
    class ScriptedBlobStore : public BlobStore
    {
    public:
        explicit ScriptedBlobStore(std::filesystem::path root) : inner_(std::move(root)) {}

        void upload(const std::filesystem::path &local_path, const std::string &bucket, const std::string &key,
                    const ProgressCallback &progress) override
        {
            if (fail_keys.contains(key))
            {
                throw TransferError(ErrorCode::Network, "simulated network failure for " + key);
            }
            ++uploads;
            inner_.upload(local_path, bucket, key, progress);
        }

        void download(const std::string &bucket, const std::string &key, const std::filesystem::path &local_path,
                      const ProgressCallback &progress) override
        {
            if (fail_keys.contains(key))
            {
                throw TransferError(ErrorCode::PermissionDenied, "simulated denial for " + key);
            }
            downloaded.push_back(key);
            inner_.download(bucket, key, local_path, progress);
        }

        std::vector<std::string> list_keys(const std::string &bucket) override
        {
            if (fail_listing)
            {
                throw TransferError(ErrorCode::Network, "simulated listing failure");
            }
            return inner_.list_keys(bucket);
        }

        std::set<std::string> fail_keys;
        bool fail_listing{false};
        std::size_t uploads{0};
        std::vector<std::string> downloaded;

    private:
        LocalBlobStore inner_;
    };

    class RecordingNotifier : public Notifier
    {
    public:
        void notify(const std::string &name) override { names.push_back(name); }
        std::vector<std::string> names;
    };

    class BrokenNotifier : public Notifier
    {
    public:
        void notify(const std::string &) override { throw std::runtime_error("no audio device"); }
    };

    struct UploadFixture
    {
        explicit UploadFixture(const std::string &name)
            : root(fresh_dir(name)),
              store(root / "remote"),
              ledger(root / "upload_history.json")
        {
            std::filesystem::create_directories(root / "input");
            std::filesystem::create_directories(root / "input_archive");
            std::filesystem::create_directories(root / "remote" / "uploads");
        }

        ~UploadFixture()
        {
            std::error_code ec;
            std::filesystem::remove_all(root, ec);
        }

        UploadLoop loop()
        {
            return UploadLoop(UploadLoopSettings{.input_dir = root / "input",
                                                 .archive_dir = root / "input_archive",
                                                 .bucket = "uploads",
                                                 .interval = std::chrono::milliseconds{50},
                                                 .show_progress = false},
                              store, ledger);
        }

        std::filesystem::path root;
        ScriptedBlobStore store;
        HistoryLedger ledger;
    };

    struct DownloadFixture
    {
        explicit DownloadFixture(const std::string &name)
            : root(fresh_dir(name)),
              store(root / "remote"),
              ledger(root / "download_history.json")
        {
            std::filesystem::create_directories(root / "output");
            std::filesystem::create_directories(root / "remote" / "results");
        }

        ~DownloadFixture()
        {
            std::error_code ec;
            std::filesystem::remove_all(root, ec);
        }

        DownloadLoop loop(Notifier &notifier)
        {
            return DownloadLoop(DownloadLoopSettings{.output_dir = root / "output",
                                                     .bucket = "results",
                                                     .interval = std::chrono::milliseconds{50},
                                                     .show_progress = false},
                                store, ledger, notifier);
        }

        void put_remote(const std::string &key, const std::string &content)
        {
            write_file(root / "remote" / "results" / key, content);
        }

        std::filesystem::path root;
        ScriptedBlobStore store;
        HistoryLedger ledger;
    };

    void test_normalize_filename()
    {
        assert(normalize_filename("report final.csv") == "report_final.csv");
        assert(normalize_filename("a  b c") == "a__b_c");
        assert(normalize_filename("plain.txt") == "plain.txt");
        assert(normalize_filename(normalize_filename("x y")) == "x_y");
    }

    void test_unique_destination()
    {
        const auto root = fresh_dir("bucketsync_unique_dest");
        assert(unique_destination(root, "data.csv") == root / "data.csv");
        write_file(root / "data.csv", "1");
        assert(unique_destination(root, "data.csv") == root / "data_1.csv");
        write_file(root / "data_1.csv", "2");
        assert(unique_destination(root, "data.csv") == root / "data_2.csv");
        write_file(root / "README", "3");
        assert(unique_destination(root, "README") == root / "README_1");
        std::filesystem::remove_all(root);
    }

    void test_upload_renames_uploads_records_and_archives()
    {
        UploadFixture fx("bucketsync_upload_scenario");
        write_file(fx.root / "input" / "report final.csv", "a,b\n");

        auto loop = fx.loop();
        const auto report = loop.run_once();
        assert(report.uploaded == 1);
        assert(report.failed == 0);

        assert(std::filesystem::exists(fx.root / "remote" / "uploads" / "report_final.csv"));
        assert(read_file(fx.root / "remote" / "uploads" / "report_final.csv") == "a,b\n");
        assert(fx.ledger.contains("report_final.csv"));
        assert(!fx.ledger.contains("report final.csv"));
        assert(std::filesystem::exists(fx.root / "input_archive" / "report_final.csv"));
        assert(count_files(fx.root / "input") == 0);

        HistoryLedger persisted(fx.root / "upload_history.json");
        assert(persisted.contains("report_final.csv"));
    }

    void test_upload_is_idempotent_once_archived()
    {
        UploadFixture fx("bucketsync_upload_idempotent");
        write_file(fx.root / "input" / "a.txt", "1");
        write_file(fx.root / "input" / "b.txt", "2");

        auto loop = fx.loop();
        assert(loop.run_once().uploaded == 2);
        const auto second = loop.run_once();
        assert(second.uploaded == 0);
        assert(second.failed == 0);

        assert(fx.store.uploads == 2);
        assert(fx.ledger.size() == 2);
        assert(fx.ledger.entries()[0] == "a.txt");
        assert(fx.ledger.entries()[1] == "b.txt");
        assert(count_files(fx.root / "remote" / "uploads") == 2);
    }

    void test_upload_reupload_does_not_duplicate_ledger()
    {
        UploadFixture fx("bucketsync_upload_reupload");
        // Left behind by a crash between the ledger flush and the archive move.
        fx.ledger.record("left.txt");
        write_file(fx.root / "input" / "left.txt", "again");

        auto loop = fx.loop();
        assert(loop.run_once().uploaded == 1);
        assert(fx.ledger.size() == 1);
        assert(std::filesystem::exists(fx.root / "input_archive" / "left.txt"));
    }

    void test_upload_failure_is_isolated_and_retried()
    {
        UploadFixture fx("bucketsync_upload_failure");
        write_file(fx.root / "input" / "bad.bin", "x");
        write_file(fx.root / "input" / "good.bin", "y");
        fx.store.fail_keys.insert("bad.bin");

        auto loop = fx.loop();
        auto report = loop.run_once();
        assert(report.uploaded == 1);
        assert(report.failed == 1);
        assert(!fx.ledger.contains("bad.bin"));
        assert(fx.ledger.contains("good.bin"));
        assert(std::filesystem::exists(fx.root / "input" / "bad.bin"));
        assert(std::filesystem::exists(fx.root / "input_archive" / "good.bin"));

        fx.store.fail_keys.clear();
        report = loop.run_once();
        assert(report.uploaded == 1);
        assert(fx.ledger.contains("bad.bin"));
        assert(count_files(fx.root / "input") == 0);
    }

    void test_upload_keeps_file_when_ledger_write_fails()
    {
        UploadFixture fx("bucketsync_upload_ledger_failure");
        write_file(fx.root / "input" / "ledgered.csv", "1,2\n");
        block_ledger_writes(fx.ledger);

        auto loop = fx.loop();
        auto report = loop.run_once();
        assert(report.uploaded == 0);
        assert(report.failed == 1);
        assert(fx.store.uploads == 1);
        assert(!fx.ledger.contains("ledgered.csv"));
        assert(std::filesystem::exists(fx.root / "input" / "ledgered.csv"));
        assert(count_files(fx.root / "input_archive") == 0);

        unblock_ledger_writes(fx.ledger);
        report = loop.run_once();
        assert(report.uploaded == 1);
        assert(report.failed == 0);
        assert(fx.store.uploads == 2);
        assert(fx.ledger.size() == 1);
        assert(HistoryLedger(fx.ledger.path()).contains("ledgered.csv"));
        assert(read_file(fx.root / "input_archive" / "ledgered.csv") == "1,2\n");
        assert(count_files(fx.root / "input") == 0);
    }

    void test_upload_archive_collision_keeps_both_files()
    {
        UploadFixture fx("bucketsync_upload_collision");
        write_file(fx.root / "input_archive" / "daily.csv", "old");
        write_file(fx.root / "input" / "daily.csv", "new");

        auto loop = fx.loop();
        assert(loop.run_once().uploaded == 1);
        assert(read_file(fx.root / "input_archive" / "daily.csv") == "old");
        assert(read_file(fx.root / "input_archive" / "daily_1.csv") == "new");
        assert(fx.ledger.size() == 1);
    }

    void test_upload_rename_conflict_is_skipped()
    {
        UploadFixture fx("bucketsync_upload_rename_conflict");
        write_file(fx.root / "input" / "my file.txt", "spaced");
        write_file(fx.root / "input" / "my_file.txt", "plain");
        fx.store.fail_keys.insert("my_file.txt");

        auto loop = fx.loop();
        const auto report = loop.run_once();
        assert(report.skipped == 1);
        assert(report.failed == 1);
        assert(read_file(fx.root / "input" / "my file.txt") == "spaced");
        assert(read_file(fx.root / "input" / "my_file.txt") == "plain");
    }

    void test_upload_ignores_directories()
    {
        UploadFixture fx("bucketsync_upload_dirs");
        std::filesystem::create_directories(fx.root / "input" / "nested");
        write_file(fx.root / "input" / "nested" / "inner.txt", "z");

        auto loop = fx.loop();
        const auto report = loop.run_once();
        assert(report.uploaded == 0);
        assert(report.failed == 0);
        assert(fx.ledger.size() == 0);
    }

    void test_download_fetches_new_keys()
    {
        DownloadFixture fx("bucketsync_download_new");
        fx.put_remote("a.txt", "alpha");
        fx.put_remote("b.txt", "beta");

        RecordingNotifier notifier;
        auto loop = fx.loop(notifier);
        const auto report = loop.run_once();
        assert(report.downloaded == 2);
        assert(read_file(fx.root / "output" / "a.txt") == "alpha");
        assert(read_file(fx.root / "output" / "b.txt") == "beta");
        assert(fx.ledger.contains("a.txt"));
        assert(fx.ledger.contains("b.txt"));
        assert(notifier.names.size() == 2);
        assert(!std::filesystem::exists(fx.root / "output" / "a.txt.part"));
    }

    void test_download_skips_recorded_keys()
    {
        DownloadFixture fx("bucketsync_download_skip");
        fx.put_remote("a.txt", "alpha");
        fx.put_remote("b.txt", "beta");
        fx.ledger.record("a.txt");

        RecordingNotifier notifier;
        auto loop = fx.loop(notifier);
        auto report = loop.run_once();
        assert(report.downloaded == 1);
        assert(report.skipped == 1);
        assert((fx.store.downloaded == std::vector<std::string>{"b.txt"}));
        assert(!std::filesystem::exists(fx.root / "output" / "a.txt"));

        report = loop.run_once();
        assert(report.downloaded == 0);
        assert(report.skipped == 2);
        assert(fx.store.downloaded.size() == 1);
    }

    void test_download_failure_is_isolated()
    {
        DownloadFixture fx("bucketsync_download_failure");
        fx.put_remote("denied.txt", "secret");
        fx.put_remote("ok.txt", "fine");
        fx.put_remote("sub/dir/deep.txt", "deep");
        fx.store.fail_keys.insert("denied.txt");

        BrokenNotifier notifier;
        auto loop = fx.loop(notifier);
        const auto report = loop.run_once();
        assert(report.downloaded == 2);
        assert(report.failed == 1);
        assert(!fx.ledger.contains("denied.txt"));
        assert(fx.ledger.contains("ok.txt"));
        assert(fx.ledger.contains("sub/dir/deep.txt"));
        assert(read_file(fx.root / "output" / "sub" / "dir" / "deep.txt") == "deep");
        assert(!std::filesystem::exists(fx.root / "output" / "denied.txt"));
        assert(!std::filesystem::exists(fx.root / "output" / "denied.txt.part"));
    }

    void test_download_retries_when_ledger_write_fails()
    {
        DownloadFixture fx("bucketsync_download_ledger_failure");
        fx.put_remote("result.json", "{}");
        block_ledger_writes(fx.ledger);

        RecordingNotifier notifier;
        auto loop = fx.loop(notifier);
        auto report = loop.run_once();
        assert(report.downloaded == 0);
        assert(report.failed == 1);
        assert(!fx.ledger.contains("result.json"));
        assert(fx.store.downloaded.size() == 1);

        unblock_ledger_writes(fx.ledger);
        report = loop.run_once();
        assert(report.downloaded == 1);
        assert(report.failed == 0);
        assert((fx.store.downloaded == std::vector<std::string>{"result.json", "result.json"}));
        assert(HistoryLedger(fx.ledger.path()).contains("result.json"));
        assert(read_file(fx.root / "output" / "result.json") == "{}");

        report = loop.run_once();
        assert(report.skipped == 1);
        assert(fx.store.downloaded.size() == 2);
    }

    void test_download_listing_failure()
    {
        DownloadFixture fx("bucketsync_download_listing");
        fx.put_remote("a.txt", "alpha");
        fx.store.fail_listing = true;

        RecordingNotifier notifier;
        auto loop = fx.loop(notifier);
        auto report = loop.run_once();
        assert(report.listing_failed);
        assert(fx.ledger.size() == 0);

        fx.store.fail_listing = false;
        report = loop.run_once();
        assert(!report.listing_failed);
        assert(report.downloaded == 1);
    }

    void test_cancellation_token()
    {
        CancellationToken token;
        assert(!token.stop_requested());
        assert(token.sleep_for(std::chrono::milliseconds{5}));

        std::thread stopper([&token]
                            {
            std::this_thread::sleep_for(std::chrono::milliseconds{50});
            token.request_stop(); });
        const auto begin = std::chrono::steady_clock::now();
        const bool slept = token.sleep_for(std::chrono::seconds{30});
        const auto elapsed = std::chrono::steady_clock::now() - begin;
        stopper.join();

        assert(!slept);
        assert(token.stop_requested());
        assert(elapsed < std::chrono::seconds{5});
        assert(!token.sleep_for(std::chrono::seconds{30}));
    }

    DaemonConfig daemon_config(const std::filesystem::path &root, std::chrono::milliseconds interval)
    {
        DaemonConfig config;
        config.upload_bucket = "uploads";
        config.download_bucket = "results";
        config.input = root / "input";
        config.output = root / "output";
        config.upload_history = root / "upload_history.json";
        config.download_history = root / "download_history.json";
        config.sleep_interval = interval;
        config.backend = Backend::Local;
        config.local_root = root / "remote";
        config.show_progress = false;
        return config;
    }

    void test_daemon_lifecycle_stops_within_interval()
    {
        const auto root = fresh_dir("bucketsync_daemon_lifecycle");
        std::filesystem::create_directories(root / "remote" / "uploads");
        std::filesystem::create_directories(root / "remote" / "results");
        write_file(root / "remote" / "results" / "result.txt", "done");

        const auto interval = std::chrono::milliseconds{500};
        Daemon daemon(daemon_config(root, interval), std::make_unique<LocalBlobStore>(root / "remote"),
                      std::make_unique<RecordingNotifier>());
        assert(daemon.state() == DaemonState::Starting);

        write_file(root / "input" / "queued file.txt", "queued");

        daemon.start();
        assert(daemon.state() == DaemonState::Running);
        assert(std::filesystem::is_directory(root / "input_archive"));
        assert(std::filesystem::is_directory(root / "output"));

        // Let both loops finish their first pass and go to sleep.
        std::this_thread::sleep_for(std::chrono::milliseconds{200});

        const auto begin = std::chrono::steady_clock::now();
        daemon.request_stop();
        daemon.wait();
        const auto elapsed = std::chrono::steady_clock::now() - begin;

        assert(daemon.state() == DaemonState::Stopped);
        assert(elapsed < interval + std::chrono::milliseconds{250});
        assert(std::filesystem::exists(root / "output" / "result.txt"));
        assert(daemon.download_ledger()->contains("result.txt"));
        assert(daemon.upload_ledger()->contains("queued_file.txt"));
        assert(std::filesystem::exists(root / "input_archive" / "queued_file.txt"));
        assert(std::filesystem::exists(root / "remote" / "uploads" / "queued_file.txt"));

        std::filesystem::remove_all(root);
    }

    void test_daemon_refuses_corrupt_ledger()
    {
        const auto root = fresh_dir("bucketsync_daemon_corrupt");
        write_file(root / "upload_history.json", "not json");

        Daemon daemon(daemon_config(root, std::chrono::milliseconds{100}),
                      std::make_unique<LocalBlobStore>(root / "remote"), std::make_unique<RecordingNotifier>());
        bool caught = false;
        try
        {
            daemon.start();
        }
        catch (const LedgerError &)
        {
            caught = true;
        }
        assert(caught);
        assert(daemon.state() == DaemonState::Stopped);

        std::filesystem::remove_all(root);
    }

    void test_daemon_run_returns_after_request_stop()
    {
        const auto root = fresh_dir("bucketsync_daemon_run");
        std::filesystem::create_directories(root / "remote" / "uploads");
        std::filesystem::create_directories(root / "remote" / "results");

        Daemon daemon(daemon_config(root, std::chrono::milliseconds{200}),
                      std::make_unique<LocalBlobStore>(root / "remote"), std::make_unique<RecordingNotifier>());
        std::thread runner([&daemon]
                           { daemon.run(); });
        while (daemon.state() == DaemonState::Starting)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds{5});
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{50});
        daemon.request_stop();
        runner.join();
        assert(daemon.state() == DaemonState::Stopped);

        std::filesystem::remove_all(root);
    }

    void test_config_file_and_flags()
    {
        const auto root = fresh_dir("bucketsync_config");
        const auto config_path = root / "bucketsync.json";
        const auto login_path = root / "login.json";
        {
            std::ofstream out(config_path);
            out << nlohmann::json{{"s3", {{"input_bucket", "in-bucket"}, {"output_bucket", "out-bucket"}, {"region", "eu-west-1"}}},
                                  {"input", "drop"},
                                  {"sleep_interval", 30},
                                  {"transfer_timeout", 120},
                                  {"notify_command", "true"}}
                       .dump();
        }
        {
            std::ofstream out(login_path);
            out << R"({"aws": {"access_key_id": "AKIDEXAMPLE", "secret_access_key": "secret"}})";
        }

        ::unsetenv("AWS_ACCESS_KEY_ID");
        ::unsetenv("AWS_SECRET_ACCESS_KEY");
        ::unsetenv("AWS_REGION");

        const auto config_arg = config_path.string();
        const auto login_arg = login_path.string();
        std::vector<std::string> args{"bucketsync", "--config", config_arg, "--credentials", login_arg,
                                      "--interval", "5", "--output", "results"};
        std::vector<char *> argv;
        for (auto &arg : args)
        {
            argv.push_back(arg.data());
        }

        const auto parsed = parse_arguments(static_cast<int>(argv.size()), argv.data());
        const auto &config = parsed.config;
        assert(!parsed.show_help);
        assert(config.upload_bucket == "in-bucket");
        assert(config.download_bucket == "out-bucket");
        assert(config.region == "eu-west-1");
        assert(config.resolved_endpoint() == "https://s3.eu-west-1.amazonaws.com");
        assert(config.input == "drop");
        assert(config.archive_dir() == "drop_archive");
        assert(config.output == "results");
        assert(config.sleep_interval == std::chrono::seconds{5});
        assert(config.transfer_timeout == std::chrono::seconds{120});
        assert(config.access_key_id == "AKIDEXAMPLE");
        assert(config.secret_access_key == "secret");
        assert(config.notify_command == "true");
        assert(config.backend == Backend::S3);

        std::filesystem::remove_all(root);
    }

    void test_config_defaults_and_validation()
    {
        DaemonConfig defaults;
        assert(defaults.sleep_interval == std::chrono::seconds{10});
        assert(defaults.archive_dir() == "input_archive");
        assert(defaults.upload_history == "upload_history.json");
        assert(defaults.download_history == "download_history.json");

        auto expect_config_error = [](std::vector<std::string> args)
        {
            std::vector<char *> argv;
            for (auto &arg : args)
            {
                argv.push_back(arg.data());
            }
            bool caught = false;
            try
            {
                (void)parse_arguments(static_cast<int>(argv.size()), argv.data());
            }
            catch (const ConfigError &)
            {
                caught = true;
            }
            assert(caught);
        };

        ::unsetenv("AWS_ACCESS_KEY_ID");
        ::unsetenv("AWS_SECRET_ACCESS_KEY");
        const auto missing = (std::filesystem::temp_directory_path() / "bucketsync_missing.json").string();
        expect_config_error({"bucketsync", "--config", missing});
        expect_config_error({"bucketsync", "--bogus"});
        expect_config_error({"bucketsync", "--interval"});
        expect_config_error({"bucketsync", "--upload-bucket", "a", "--download-bucket", "b", "--interval", "ten",
                             "--backend", "local", "--local-root", "/tmp"});
        expect_config_error({"bucketsync", "--upload-bucket", "a", "--download-bucket", "b"});
        expect_config_error({"bucketsync", "--upload-bucket", "a", "--download-bucket", "b", "--backend", "local"});
        expect_config_error({"bucketsync", "--upload-bucket", "a", "--download-bucket", "b", "--backend", "ftp"});
        expect_config_error({"bucketsync", "--upload-bucket", "a", "--download-bucket", "b", "--backend", "local",
                             "--local-root", "/tmp", "--interval", "10000000000000"});
        expect_config_error({"bucketsync", "--upload-bucket", "a", "--download-bucket", "b", "--backend", "local",
                             "--local-root", "/tmp", "--transfer-timeout", "86401"});

        const auto oversized = std::filesystem::temp_directory_path() / "bucketsync_oversized.json";
        {
            std::ofstream out(oversized);
            out << nlohmann::json{{"upload_bucket", "a"},
                                  {"download_bucket", "b"},
                                  {"backend", "local"},
                                  {"local_root", "/tmp"},
                                  {"sleep_interval", 10000000000000LL}}
                       .dump();
        }
        expect_config_error({"bucketsync", "--config", oversized.string()});
        std::filesystem::remove(oversized);

        DaemonConfig too_slow;
        too_slow.upload_bucket = "a";
        too_slow.download_bucket = "b";
        too_slow.backend = Backend::Local;
        too_slow.local_root = "/tmp";
        validate(too_slow);
        too_slow.sleep_interval = kMaxDurationSetting + std::chrono::seconds{1};
        bool rejected = false;
        try
        {
            validate(too_slow);
        }
        catch (const ConfigError &)
        {
            rejected = true;
        }
        assert(rejected);
        too_slow.sleep_interval = kMaxDurationSetting;
        validate(too_slow);

        std::vector<std::string> help_args{"bucketsync", "--help"};
        std::vector<char *> argv{help_args[0].data(), help_args[1].data()};
        assert(parse_arguments(2, argv.data()).show_help);

        std::vector<std::string> local_args{"bucketsync", "--upload-bucket", "a", "--download-bucket", "b",
                                            "--backend", "local", "--local-root", "/tmp/remote", "--no-progress"};
        argv.clear();
        for (auto &arg : local_args)
        {
            argv.push_back(arg.data());
        }
        const auto local = parse_arguments(static_cast<int>(argv.size()), argv.data());
        assert(local.config.backend == Backend::Local);
        assert(!local.config.show_progress);
    }

    void test_command_notifier_reports_failure()
    {
        CommandNotifier ok("true");
        ok.notify("a.txt");

        CommandNotifier failing("false");
        bool caught = false;
        try
        {
            failing.notify("a.txt");
        }
        catch (const std::runtime_error &)
        {
            caught = true;
        }
        assert(caught);

        std::ostringstream bell;
        BellNotifier bell_notifier(bell);
        bell_notifier.notify("a.txt");
        assert(bell.str() == "\a");
    }

    void test_console_progress()
    {
        std::ostringstream out;
        auto progress = console_progress(out, "Uploading", "a.bin");
        progress(50, 100);
        progress(50, 100);
        progress(100, 100);
        const auto text = out.str();
        assert(text.find("Uploading a.bin: 50 / 100 bytes (50%)") != std::string::npos);
        assert(text.find("100 / 100 bytes (100%)\n") != std::string::npos);
        assert(text.find("(50%)", text.find("(50%)") + 1) == std::string::npos);
    }

} // namespace

void run_daemon_component_tests()
{
    test_normalize_filename();
    test_unique_destination();
    test_upload_renames_uploads_records_and_archives();
    test_upload_is_idempotent_once_archived();
    test_upload_reupload_does_not_duplicate_ledger();
    test_upload_failure_is_isolated_and_retried();
    test_upload_keeps_file_when_ledger_write_fails();
    test_upload_archive_collision_keeps_both_files();
    test_upload_rename_conflict_is_skipped();
    test_upload_ignores_directories();
    test_download_fetches_new_keys();
    test_download_skips_recorded_keys();
    test_download_failure_is_isolated();
    test_download_retries_when_ledger_write_fails();
    test_download_listing_failure();
    test_cancellation_token();
    test_daemon_lifecycle_stops_within_interval();
    test_daemon_refuses_corrupt_ledger();
    test_daemon_run_returns_after_request_stop();
    test_config_file_and_flags();
    test_config_defaults_and_validation();
    test_command_notifier_reports_failure();
    test_console_progress();
}
