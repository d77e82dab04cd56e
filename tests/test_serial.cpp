#include <gtest/gtest.h>
#include "../src/serial.hpp"
#include "../src/target.hpp"
#include "../src/exception.hpp"
#include "../src/hash.hpp"
#include "../src/localization.hpp"
#include "../src/utils.hpp"
#include <algorithm>
#include <deque>
#include <fcntl.h>
#include <map>
#include <memory>
#include <set>
#include <stdlib.h>
#include <unistd.h>

namespace {

// In-memory device speaking the line protocol of SerialTargetAdapter
struct DeviceState {
    std::map<std::string, std::string> files;
    std::set<std::string> dirs = {"/lib"};
    std::vector<std::string> commands;
    bool noisy = false;
    bool silent = false;
    std::string listing_override;
};

class FakeDevice : public SerialConnection {
public:
    explicit FakeDevice(std::shared_ptr<DeviceState> state) : state_(std::move(state)) {}

    void write(std::string_view data) override {
        input_.append(data);
        size_t pos;
        while ((pos = input_.find('\n')) != std::string::npos) {
            std::string line = input_.substr(0, pos);
            input_.erase(0, pos + 1);
            handle(line);
        }
    }

    std::optional<std::string> read_line(std::chrono::milliseconds) override {
        if (output_.empty()) return std::nullopt;
        std::string line = output_.front();
        output_.pop_front();
        return line;
    }

    std::string name() const override { return "/dev/fake0"; }

private:
    void reply(const std::string& line) {
        output_.push_back(state_->noisy ? "\033[0m" + line + "\r" : line);
    }

    void handle(const std::string& line) {
        if (put_path_) {
            if (line == "END") {
                state_->files[*put_path_] = base64_decode(put_data_);
                put_path_.reset();
                reply("OK");
            } else {
                put_data_ += line;
            }
            return;
        }

        state_->commands.push_back(line);
        if (state_->silent) return;
        if (state_->noisy) output_.push_back("\033]0;title\a>>> MicroPython v1.20.0\r");

        const auto space = line.find(' ');
        const std::string cmd = line.substr(0, space);
        const std::string arg = space == std::string::npos ? "" : line.substr(space + 1);

        if (cmd == "PUT") {
            const auto path_pos = arg.find(' ');
            put_path_ = arg.substr(path_pos + 1);
            put_data_.clear();
        } else if (cmd == "GET") {
            auto it = state_->files.find(arg);
            if (it == state_->files.end()) {
                reply("ERR ENOENT");
                return;
            }
            for (size_t pos = 0; pos < it->second.size(); pos += 10) {
                reply("=" + base64_encode(it->second.substr(pos, 10)));
            }
            reply("OK");
        } else if (cmd == "LS") {
            if (!state_->listing_override.empty()) {
                reply(state_->listing_override);
                reply("OK");
                return;
            }
            const std::string prefix = arg + "/";
            for (const auto& dir : state_->dirs) {
                if (dir.starts_with(prefix) && dir.find('/', prefix.size()) == std::string::npos) {
                    reply("=D " + dir.substr(prefix.size()));
                }
            }
            for (const auto& [path, content] : state_->files) {
                if (path.starts_with(prefix) && path.find('/', prefix.size()) == std::string::npos) {
                    reply("=F " + std::to_string(content.size()) + " " + path.substr(prefix.size()));
                }
            }
            reply("OK");
        } else if (cmd == "RM") {
            state_->files.erase(arg);
            reply("OK");
        } else if (cmd == "MKDIR") {
            for (auto pos = arg.find('/', 1); ; pos = arg.find('/', pos + 1)) {
                state_->dirs.insert(arg.substr(0, pos));
                if (pos == std::string::npos) break;
            }
            reply("OK");
        } else if (cmd == "RMDIR") {
            state_->dirs.erase(arg);
            reply("OK");
        } else if (cmd == "SYNC") {
            reply("OK");
        } else if (cmd == "VER") {
            reply("=micropython 1.20.0");
            reply("OK");
        } else {
            reply("ERR unknown command");
        }
    }

    std::shared_ptr<DeviceState> state_;
    std::string input_;
    std::deque<std::string> output_;
    std::optional<std::string> put_path_;
    std::string put_data_;
};

} // anonymous namespace

class SerialTargetTest : public ::testing::Test {
protected:
    std::shared_ptr<DeviceState> state;
    std::unique_ptr<SerialTargetAdapter> target;

    void SetUp() override {
        set_l10n_dir(PIPKIN_SOURCE_L10N_DIR);
        init_localization();
        state = std::make_shared<DeviceState>();
        target = std::make_unique<SerialTargetAdapter>(std::make_unique<FakeDevice>(state),
                                                       std::chrono::milliseconds(50));
    }
};

TEST_F(SerialTargetTest, WriteAndReadBack) {
    std::string content;
    for (int i = 0; i < 1000; ++i) content += static_cast<char>(i % 251);

    target->make_dirs("pkg/sub");
    target->write_file("pkg/sub/data.bin", content);
    EXPECT_EQ(state->files.at("/lib/pkg/sub/data.bin"), content);
    EXPECT_TRUE(state->dirs.contains("/lib/pkg"));
    EXPECT_EQ(state->commands[1], "PUT 1000 /lib/pkg/sub/data.bin");

    EXPECT_EQ(target->read_file("pkg/sub/data.bin"), content);
}

TEST_F(SerialTargetTest, EmptyFile) {
    target->write_file("empty.py", "");
    EXPECT_EQ(state->files.at("/lib/empty.py"), "");
    EXPECT_EQ(target->read_file("empty.py"), "");
}

TEST_F(SerialTargetTest, ListDirectory) {
    state->dirs.insert("/lib/pkg");
    state->files["/lib/b.py"] = "12345";
    state->files["/lib/a.py"] = "1";
    auto entries = target->list_dir("");
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].name, "a.py");
    EXPECT_EQ(entries[1].name, "b.py");
    EXPECT_EQ(entries[1].size, 5u);
    EXPECT_EQ(entries[2].name, "pkg");
    EXPECT_TRUE(entries[2].is_dir);
    EXPECT_EQ(state->commands.back(), "LS /lib");
}

TEST_F(SerialTargetTest, TerminalNoiseIsIgnored) {
    state->noisy = true;
    state->files["/lib/x.py"] = "hello world, this is longer than one chunk";
    EXPECT_EQ(target->read_file("x.py"), "hello world, this is longer than one chunk");
    EXPECT_EQ(target->list_dir("").size(), 1u);
    EXPECT_EQ(target->runtime_version().value(), "1.20.0");
}

TEST_F(SerialTargetTest, ErrorReplyBecomesTargetIOError) {
    try {
        target->read_file("missing.py");
        FAIL() << "expected TargetIOError";
    } catch (const TargetIOError& e) {
        EXPECT_EQ(e.operation(), "read");
        EXPECT_EQ(e.path(), "missing.py");
        EXPECT_NE(std::string(e.what()).find("ENOENT"), std::string::npos);
    }
}

TEST_F(SerialTargetTest, SilentDeviceTimesOut) {
    state->silent = true;
    EXPECT_THROW(target->sync(), TargetIOError);
}

TEST_F(SerialTargetTest, BadListingLine) {
    state->listing_override = "=X what";
    EXPECT_THROW(target->list_dir(""), TargetIOError);
    state->listing_override = "=F many a.py";
    EXPECT_THROW(target->list_dir(""), TargetIOError);
}

TEST_F(SerialTargetTest, RemoveDirOnlyWhenEmpty) {
    state->dirs.insert("/lib/pkg");
    state->files["/lib/pkg/mod.py"] = "x";
    EXPECT_FALSE(target->remove_dir_if_empty("pkg"));
    EXPECT_TRUE(state->dirs.contains("/lib/pkg"));

    target->delete_file("pkg/mod.py");
    EXPECT_TRUE(target->remove_dir_if_empty("pkg"));
    EXPECT_FALSE(state->dirs.contains("/lib/pkg"));
}

TEST_F(SerialTargetTest, RuntimeVersionIsCached) {
    EXPECT_EQ(target->runtime_version().value(), "1.20.0");
    EXPECT_EQ(target->runtime_version().value(), "1.20.0");
    EXPECT_EQ(std::count(state->commands.begin(), state->commands.end(), "VER"), 1);
    EXPECT_EQ(target->describe(), "device on /dev/fake0");
}

TEST_F(SerialTargetTest, ListDistributions) {
    state->dirs.insert("/lib/foo-1.0.dist-info");
    state->files["/lib/foo-1.0.dist-info/METADATA"] = "Metadata-Version: 2.1\nName: foo\nVersion: 1.0\n";
    state->files["/lib/foo-1.0.dist-info/RECORD"] = "foo.py,,\nfoo-1.0.dist-info/METADATA,,\n";
    state->files["/lib/foo.py"] = "x";
    PackageSnapshot snapshot = target->list_distributions();
    ASSERT_EQ(snapshot.size(), 1u);
    EXPECT_EQ(snapshot.at("foo").version(), "1.0");
    EXPECT_EQ(snapshot.at("foo").payload().size(), 1u);
}

TEST_F(SerialTargetTest, CustomPackageDirectory) {
    SerialTargetAdapter apps(std::make_unique<FakeDevice>(state), std::chrono::milliseconds(50), "apps/pkgs/");
    apps.write_file("foo.py", "x");
    EXPECT_EQ(state->files.at("/apps/pkgs/foo.py"), "x");
    apps.list_dir("");
    EXPECT_EQ(state->commands.back(), "LS /apps/pkgs");

    SerialTargetAdapter root(std::make_unique<FakeDevice>(state), std::chrono::milliseconds(50), "/");
    root.delete_file("boot.py");
    EXPECT_EQ(state->commands.back(), "RM /boot.py");
}

TEST(TerminalEscapeTest, StripsSequences) {
    EXPECT_EQ(strip_terminal_escapes("plain"), "plain");
    EXPECT_EQ(strip_terminal_escapes("OK\r"), "OK");
    EXPECT_EQ(strip_terminal_escapes("\033[1;32mOK\033[0m"), "OK");
    EXPECT_EQ(strip_terminal_escapes("\033]0;title\aOK"), "OK");
    EXPECT_EQ(strip_terminal_escapes("\033]0;title\033\\OK"), "OK");
    EXPECT_EQ(strip_terminal_escapes("\033cO\033[KK"), "OK");
    EXPECT_EQ(strip_terminal_escapes("OK\033"), "OK");
}

TEST(PosixSerialPortTest, ReadsLinesFromPty) {
    set_l10n_dir(PIPKIN_SOURCE_L10N_DIR);
    init_localization();

    int master = posix_openpt(O_RDWR | O_NOCTTY);
    ASSERT_GE(master, 0);
    ASSERT_EQ(grantpt(master), 0);
    ASSERT_EQ(unlockpt(master), 0);
    const std::string slave = ptsname(master);

    {
        PosixSerialPort port(slave);
        EXPECT_EQ(port.name(), slave);
        EXPECT_FALSE(port.read_line(std::chrono::milliseconds(20)).has_value());

        const std::string data = "first\r\nsec";
        ASSERT_EQ(::write(master, data.data(), data.size()), static_cast<ssize_t>(data.size()));
        EXPECT_EQ(port.read_line(std::chrono::milliseconds(500)).value(), "first\r");
        EXPECT_FALSE(port.read_line(std::chrono::milliseconds(20)).has_value());

        const std::string rest = "ond\n";
        ASSERT_EQ(::write(master, rest.data(), rest.size()), static_cast<ssize_t>(rest.size()));
        EXPECT_EQ(port.read_line(std::chrono::milliseconds(500)).value(), "second");
    }
    close(master);

    EXPECT_THROW(PosixSerialPort("/nonexistent/tty", 115200), TargetIOError);
    EXPECT_THROW(PosixSerialPort(slave, 12345), PipkinException);
}
