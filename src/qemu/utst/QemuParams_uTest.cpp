/**
 * @file QemuParams_uTest.cpp
 * @brief Unit tests for hvdriver::qemu argument rendering.
 */

#include "src/qemu/inc/QemuParams.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

using hvdriver::qemu::BlockDevice;
using hvdriver::qemu::CharDevice;
using hvdriver::qemu::Device;
using hvdriver::qemu::DeviceDriver;
using hvdriver::qemu::FsDevice;
using hvdriver::qemu::MemoryObject;
using hvdriver::qemu::QemuConfig;
using hvdriver::qemu::SerialDevice;
using hvdriver::qemu::toQemuParams;
using hvdriver::qemu::VfioDevice;
using hvdriver::qemu::VhostUserDevice;

using Args = std::vector<std::string>;

/* ----------------------------- Devices ----------------------------- */

/** @test 9p share: -fsdev backend then virtio-9p front-end. */
TEST(QemuParamsTest, FsDevice) {
  FsDevice dev{};
  dev.id = "extra-9p-tag";
  dev.path = "/host/dir";
  dev.mountTag = "tag";

  const Args EXPECTED = {"-fsdev", "local,id=extra-9p-tag,path=/host/dir,security_model=none",
                         "-device", "virtio-9p-pci,fsdev=extra-9p-tag,mount_tag=tag"};
  EXPECT_EQ(toQemuParams(Device{dev}), EXPECTED);

  dev.disableModern = true;
  EXPECT_EQ(toQemuParams(Device{dev})[3],
            "virtio-9p-pci,disable-modern=true,fsdev=extra-9p-tag,mount_tag=tag");
}

/** @test Console carries no port name; serial port does. */
TEST(QemuParamsTest, CharDevices) {
  CharDevice console{};
  console.driver = DeviceDriver::CONSOLE;
  console.deviceId = "console0";
  console.id = "charconsole0";
  console.path = "/run/pod/console.sock";

  const Args EXPECTED = {"-chardev", "socket,id=charconsole0,path=/run/pod/console.sock,server,nowait",
                         "-device", "virtconsole,chardev=charconsole0,id=console0"};
  EXPECT_EQ(toQemuParams(Device{console}), EXPECTED);

  CharDevice port{};
  port.deviceId = "channel0";
  port.id = "charch0";
  port.path = "/tmp/agent.sock";
  port.name = "agent.channel.0";
  EXPECT_EQ(toQemuParams(Device{port})[3],
            "virtserialport,chardev=charch0,id=channel0,name=agent.channel.0");
}

/** @test Serial controller with and without disable-modern. */
TEST(QemuParamsTest, SerialDevice) {
  SerialDevice dev{};
  dev.id = "serial0";
  EXPECT_EQ(toQemuParams(Device{dev}), (Args{"-device", "virtio-serial-pci,id=serial0"}));
  dev.disableModern = true;
  EXPECT_EQ(toQemuParams(Device{dev}),
            (Args{"-device", "virtio-serial-pci,disable-modern=true,id=serial0"}));
}

/** @test Block device: -drive backend then virtio-blk. */
TEST(QemuParamsTest, BlockDevice) {
  BlockDevice dev{};
  dev.id = "drive0";
  dev.file = "/var/lib/disk.img";
  dev.format = "raw";

  const Args EXPECTED = {"-drive", "id=drive0,file=/var/lib/disk.img,aio=threads,format=raw,if=none",
                         "-device", "virtio-blk,drive=drive0,scsi=off,config-wce=off"};
  EXPECT_EQ(toQemuParams(Device{dev}), EXPECTED);
}

/** @test VFIO passthrough. */
TEST(QemuParamsTest, VfioDevice) {
  EXPECT_EQ(toQemuParams(Device{VfioDevice{"02:10.1"}}),
            (Args{"-device", "vfio-pci,host=02:10.1"}));
}

/** @test vhost-user: chardev, netdev, then virtio-net. */
TEST(QemuParamsTest, VhostUserDevice) {
  VhostUserDevice dev{};
  dev.socketPath = "/tmp/vhu.sock";
  dev.charDevId = "char-abc";
  dev.typeDevId = "net-abc";
  dev.address = "00:11:22:33:44:55";

  const Args EXPECTED = {"-chardev", "socket,id=char-abc,path=/tmp/vhu.sock",
                         "-netdev",  "type=vhost-user,id=net-abc,chardev=char-abc,vhostforce",
                         "-device",  "virtio-net-pci,netdev=net-abc,mac=00:11:22:33:44:55"};
  EXPECT_EQ(toQemuParams(Device{dev}), EXPECTED);
}

/** @test Image object: memory backend then nvdimm front-end. */
TEST(QemuParamsTest, MemoryObject) {
  MemoryObject obj{};
  obj.deviceId = "nv0";
  obj.id = "mem0";
  obj.memPath = "/usr/share/cc.img";
  obj.size = 235929600;

  const Args EXPECTED = {"-object", "memory-backend-file,id=mem0,mem-path=/usr/share/cc.img,size=235929600",
                         "-device", "nvdimm,id=nv0,memdev=mem0"};
  EXPECT_EQ(toQemuParams(Device{obj}), EXPECTED);
}

/* ----------------------------- QemuConfig ----------------------------- */

/** @test Empty config renders nothing. */
TEST(QemuParamsTest, EmptyConfig) { EXPECT_TRUE(toQemuParams(QemuConfig{}).empty()); }

/** @test Full config renders sections in a fixed order. */
TEST(QemuParamsTest, FullConfig) {
  QemuConfig config{};
  config.name = "pod-abc";
  config.machine = {"pc-lite", "kvm,kernel_irqchip,nvdimm"};
  config.cpuModel = "host";
  config.qmpSocketPath = "/run/pod/monitor.sock";
  config.smp = {2, 2, 1, 1};
  config.memory = {"2048M", 2, "17024M"};
  config.rtc = {"utc", "slew"};
  config.devices.emplace_back(VfioDevice{"02:10.1"});
  config.kernel = {"/boot/vmlinux", "root=/dev/pmem0p1 quiet"};
  config.knobs = {true, true, true, true};

  const Args EXPECTED = {
      "-name",     "pod-abc",
      "-machine",  "pc-lite,accel=kvm,kernel_irqchip,nvdimm",
      "-cpu",      "host",
      "-qmp",      "unix:/run/pod/monitor.sock,server,nowait",
      "-smp",      "2,cores=2,sockets=1,threads=1",
      "-m",        "2048M,slots=2,maxmem=17024M",
      "-rtc",      "base=utc,driftfix=slew",
      "-device",   "vfio-pci,host=02:10.1",
      "-kernel",   "/boot/vmlinux",
      "-append",   "root=/dev/pmem0p1 quiet",
      "-no-user-config",
      "-nodefaults",
      "-nographic",
      "-daemonize",
  };
  EXPECT_EQ(toQemuParams(config), EXPECTED);
}

/** @test Devices render in list order. */
TEST(QemuParamsTest, DeviceOrderPreserved) {
  QemuConfig config{};
  config.devices.emplace_back(VfioDevice{"00:01.0"});
  config.devices.emplace_back(VfioDevice{"00:02.0"});

  const Args OUT = toQemuParams(config);
  const auto FIRST = std::find(OUT.begin(), OUT.end(), "vfio-pci,host=00:01.0");
  const auto SECOND = std::find(OUT.begin(), OUT.end(), "vfio-pci,host=00:02.0");
  ASSERT_NE(FIRST, OUT.end());
  ASSERT_NE(SECOND, OUT.end());
  EXPECT_LT(FIRST, SECOND);
}
