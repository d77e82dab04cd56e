#include <gtest/gtest.h>
#include "../src/detect.hpp"
#include "../src/exception.hpp"
#include "../src/localization.hpp"
#include "../src/utils.hpp"
#include <filesystem>
#include <unistd.h>

namespace fs = std::filesystem;

class DetectTest : public ::testing::Test {
protected:
    fs::path test_root;
    DetectionSources sources;

    void SetUp() override {
        set_l10n_dir(PIPKIN_SOURCE_L10N_DIR);
        init_localization();
        test_root = fs::absolute("tmp_detect_test_" + std::to_string(getpid()));
        fs::remove_all(test_root);
        fs::create_directories(test_root / "sys/class/tty");
        fs::create_directories(test_root / "dev");
        sources.sysfs_tty = test_root / "sys/class/tty";
        sources.mounts_file = test_root / "mounts";
        sources.dev_dir = test_root / "dev";
        write_file_bytes(sources.mounts_file, "proc /proc proc rw 0 0\n/dev/sda1 / ext4 rw 0 0\n");
    }

    void TearDown() override {
        fs::remove_all(test_root);
    }

    // sysfs layout: tty/<name>/device -> .../<usb device>/<interface>
    void add_tty(const std::string& name, const std::string& vid, const std::string& product) {
        const fs::path usb_device = test_root / "sys/devices/usb1" / name;
        const fs::path interface = usb_device / "1-1:1.0";
        fs::create_directories(interface);
        write_file_bytes(usb_device / "idVendor", vid + "\n");
        if (!product.empty()) write_file_bytes(usb_device / "product", product + "\n");
        fs::create_directories(sources.sysfs_tty / name);
        fs::create_directory_symlink(interface, sources.sysfs_tty / name / "device");
    }

    void add_mount(const std::string& line) {
        write_file_bytes(sources.mounts_file, read_file_bytes(sources.mounts_file) + line + "\n");
    }
};

TEST_F(DetectTest, FindsKnownSerialDevices) {
    add_tty("ttyACM0", "2E8A", "Board in FS mode");
    add_tty("ttyUSB0", "0403", "FT232R");
    fs::create_directories(sources.sysfs_tty / "ttyS0");

    auto candidates = find_target_candidates(sources);
    ASSERT_EQ(candidates.size(), 1u);
    EXPECT_EQ(candidates[0].kind, TargetCandidate::Kind::Serial);
    EXPECT_EQ(candidates[0].location, (sources.dev_dir / "ttyACM0").string());
    EXPECT_EQ(candidates[0].description, "2e8a Board in FS mode");
}

TEST_F(DetectTest, FindsKnownVolumes) {
    add_mount("/dev/sdb1 /media/user/CIRCUITPY vfat rw 0 0");
    add_mount("/dev/sdc1 /media/my\\040stuff/PYBFLASH vfat rw 0 0");
    add_mount("/dev/sdd1 /media/user/USBSTICK vfat rw 0 0");

    auto candidates = find_target_candidates(sources);
    ASSERT_EQ(candidates.size(), 2u);
    EXPECT_EQ(candidates[0].location, "/media/user/CIRCUITPY");
    EXPECT_EQ(candidates[1].location, "/media/my stuff/PYBFLASH");
    EXPECT_EQ(candidates[1].description, "/dev/sdc1");
}

TEST_F(DetectTest, NoCandidateThrowsNoTargetFound) {
    add_tty("ttyUSB0", "0403", "");
    EXPECT_THROW(create_target_adapter({}, sources), NoTargetFound);
}

TEST_F(DetectTest, SeveralCandidatesThrowNoTargetFound) {
    add_tty("ttyACM0", "f055", "Pyboard");
    add_mount("/dev/sdb1 /media/user/CIRCUITPY vfat rw 0 0");
    try {
        create_target_adapter({}, sources);
        FAIL() << "expected NoTargetFound";
    } catch (const NoTargetFound& e) {
        const std::string message = e.what();
        EXPECT_NE(message.find("ttyACM0"), std::string::npos);
        EXPECT_NE(message.find("CIRCUITPY"), std::string::npos);
    }
}

TEST_F(DetectTest, SingleVolumeIsUsed) {
    const fs::path mount = test_root / "media" / "CIRCUITPY";
    fs::create_directories(mount);
    add_mount("/dev/sdb1 " + mount.string() + " vfat rw 0 0");

    auto target = create_target_adapter({}, sources);
    ASSERT_NE(dynamic_cast<MountTargetAdapter*>(target.get()), nullptr);
    EXPECT_TRUE(target->list_distributions().empty());
}

TEST_F(DetectTest, ExplicitSelection) {
    TargetSelection selection;
    selection.dir = (test_root / "target").string();
    auto target = create_target_adapter(selection, sources);
    auto* dir = dynamic_cast<DirTargetAdapter*>(target.get());
    ASSERT_NE(dir, nullptr);
    EXPECT_EQ(dir->root(), test_root / "target");

    selection.mount = "/media/user/CIRCUITPY";
    EXPECT_THROW(create_target_adapter(selection, sources), PipkinException);
}

TEST_F(DetectTest, PackageDirectoryOverride) {
    TargetSelection selection;
    selection.dir = (test_root / "target").string();
    selection.package_dir = "/apps/pkgs";
    auto target = create_target_adapter(selection, sources);
    auto* dir = dynamic_cast<DirTargetAdapter*>(target.get());
    ASSERT_NE(dir, nullptr);
    EXPECT_EQ(dir->root(), test_root / "target" / "apps" / "pkgs");

    const fs::path mount = test_root / "media" / "CIRCUITPY";
    fs::create_directories(mount);
    selection = {};
    selection.mount = mount.string();
    selection.package_dir = "pkgs";
    target = create_target_adapter(selection, sources);
    target->write_file("foo.py", "x");
    EXPECT_TRUE(fs::exists(mount / "pkgs" / "foo.py"));
}
