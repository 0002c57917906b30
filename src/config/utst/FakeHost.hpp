#ifndef KEEPER_CONFIG_FAKE_HOST_HPP
#define KEEPER_CONFIG_FAKE_HOST_HPP
/**
 * @file FakeHost.hpp
 * @brief Scratch host for lifecycle tests: fake sysfs, fake collaborators.
 *
 * Test-only. Every external program of Config::tools is a /bin/sh script in
 * the scratch tree that appends "<tool> <args>" to calls.log:
 *  - insmod / rmmod maintain <sys>/<name>/refcnt, adding or removing one
 *    reference on each declared dependency (rmmod refuses refcnt > 0)
 *  - make writes each requested target; ld writes its -o output
 *  - mkprecompiled --pack writes the package, --unpack writes interface
 *    objects, core objects and module files, --match prints the match line
 *
 * A collaborator fails when a marker file "fail-<what>" exists in the tree
 * root (fail-make, fail-ld, fail-pack, fail-unpack, fail-match,
 * fail-provision, fail-sign, fail-persistenced, fail-insmod-<module>,
 * fail-rmmod-<module>). "unpack-without-linked" makes --unpack omit the
 * linked module files.
 */

#include "src/config/inc/Config.hpp"
#include "src/helpers/utst/TempTree.hpp"

#include <unistd.h> // geteuid

#include <cstddef>
#include <cstdlib> // strtol
#include <string>

namespace keeper {
namespace test {

class FakeHost {
public:
  TempTree tree;
  config::Config cfg;

  FakeHost() {
    cfg.driverName = "nvidia";
    cfg.driverVersion = "550.54.14";
    cfg.kernelVersion = "5.10.0";
    cfg.runningKernel = "5.10.0";
    cfg.acceptLicense = true;
    cfg.maxThreads = 2;

    cfg.runDir = tree.mkdir("run/nvidia");
    cfg.lockFile = cfg.runDir + "/driver-keeper.pid";
    cfg.sourceDir = tree.mkdir("usr/src/nvidia-550.54.14");
    cfg.cacheDir = cfg.sourceDir + "/precompiled";
    cfg.stagingDir = cfg.sourceDir + "/staging";
    cfg.modulesRoot = tree.mkdir("lib/modules");
    cfg.sysModuleRoot = tree.mkdir("sys/module");
    cfg.procModules = tree.write("proc/modules", "");
    cfg.mountsFile = tree.write("proc/mounts", "");
    cfg.persistencedPidFile = tree.path("run/nvidia-persistenced/nvidia-persistenced.pid");
    cfg.hookDir.clear();
    cfg.selfPath = "/bin/true";
    cfg.publishRootfs = false;
    cfg.publishSource = tree.mkdir("rootfs");
    cfg.publishTarget = cfg.runDir + "/driver";
    cfg.privateHierarchy.clear();
    cfg.modules = config::defaultModuleSet();
    cfg.auxModules = {"ipmi_msghandler"};

    // Driver source tree with prebuilt core objects
    const std::string KSRC = "usr/src/nvidia-550.54.14/kernel/";
    for (const config::ModuleSpec& MOD : cfg.modules) {
      if (MOD.isLinked()) {
        tree.write(KSRC + MOD.coreObject, "core\n");
      }
    }

    writeDependencies();
    writeTools();
  }

  /* ----------------------------- Kernel State ----------------------------- */

  /// @brief Mark a module loaded with a refcount (no dependency bookkeeping).
  void setLoaded(const std::string& name, int refcnt) const {
    tree.write("sys/module/" + name + "/refcnt", std::to_string(refcnt) + "\n");
  }

  /// @brief Load the whole declared set with consistent refcounts.
  void loadAll() const {
    for (const config::ModuleSpec& MOD : cfg.modules) {
      setLoaded(MOD.name, static_cast<int>(cfg.dependentsOf(MOD.name).size()));
    }
  }

  [[nodiscard]] bool isLoaded(const std::string& name) const {
    return tree.exists("sys/module/" + name + "/refcnt");
  }

  [[nodiscard]] int refcount(const std::string& name) const {
    const std::string TEXT = tree.read("sys/module/" + name + "/refcnt");
    return TEXT.empty() ? -1 : static_cast<int>(std::strtol(TEXT.c_str(), nullptr, 10));
  }

  [[nodiscard]] bool noneLoaded() const {
    for (const config::ModuleSpec& MOD : cfg.modules) {
      if (isLoaded(MOD.name)) {
        return false;
      }
    }
    return true;
  }

  [[nodiscard]] bool allLoaded() const {
    for (const config::ModuleSpec& MOD : cfg.modules) {
      if (!isLoaded(MOD.name)) {
        return false;
      }
    }
    return true;
  }

  /* ----------------------------- Collaborators ----------------------------- */

  void fail(const std::string& what) const { tree.touch("fail-" + what); }
  void heal(const std::string& what) const { tree.remove("fail-" + what); }

  [[nodiscard]] std::vector<std::string> calls() const { return tree.lines("calls.log"); }

  void clearCalls() const { tree.write("calls.log", ""); }

  /// @brief Number of logged calls starting with prefix (e.g. "rmmod").
  [[nodiscard]] std::size_t countCalls(const std::string& prefix) const {
    std::size_t n = 0;
    for (const std::string& LINE : calls()) {
      if (LINE.compare(0, prefix.size(), prefix) == 0) {
        ++n;
      }
    }
    return n;
  }

  [[nodiscard]] static bool isRoot() noexcept { return ::geteuid() == 0; }

private:
  void writeDependencies() const {
    for (const config::ModuleSpec& MOD : cfg.modules) {
      std::string line;
      for (const std::string& DEP : MOD.deps) {
        line += DEP + " ";
      }
      tree.write("kdeps/" + MOD.name, line + "\n");
    }
  }

  [[nodiscard]] std::string prologue() const {
    return "LOG='" + tree.path("calls.log") + "'\n" + "SYS='" + cfg.sysModuleRoot + "'\n" +
           "DEPS='" + tree.path("kdeps") + "'\n" + "FLAG='" + tree.root() + "'\n";
  }

  /// Script that only logs, failing when fail-<what> exists.
  [[nodiscard]] std::string loggingTool(const std::string& tag, const std::string& what) const {
    return prologue() + "echo \"" + tag + " $*\" >> \"$LOG\"\n" + "[ -e \"$FLAG/fail-" + what +
           "\" ] && exit 1\nexit 0\n";
  }

  void writeTools() {
    tree.write("calls.log", "");

    cfg.tools.insmod = tree.script("bin/insmod", prologue() + R"(echo "insmod $*" >> "$LOG"
[ -f "$1" ] || exit 1
name=$(basename "$1" .ko | tr - _)
[ -e "$FLAG/fail-insmod-$name" ] && exit 1
mkdir -p "$SYS/$name" || exit 1
echo 0 > "$SYS/$name/refcnt"
for d in $(cat "$DEPS/$name" 2>/dev/null); do
  c=$(cat "$SYS/$d/refcnt")
  echo $((c + 1)) > "$SYS/$d/refcnt"
done
exit 0
)");

    cfg.tools.rmmod = tree.script("bin/rmmod", prologue() + R"(echo "rmmod $*" >> "$LOG"
rc=0
for name in "$@"; do
  if [ -e "$FLAG/fail-rmmod-$name" ] || [ ! -f "$SYS/$name/refcnt" ]; then rc=1; continue; fi
  c=$(cat "$SYS/$name/refcnt")
  if [ "$c" -gt 0 ]; then rc=1; continue; fi
  rm -rf "$SYS/$name"
  for d in $(cat "$DEPS/$name" 2>/dev/null); do
    if [ -f "$SYS/$d/refcnt" ]; then
      c=$(cat "$SYS/$d/refcnt")
      echo $((c - 1)) > "$SYS/$d/refcnt"
    fi
  done
done
exit $rc
)");

    cfg.tools.make = tree.script("bin/make", prologue() + R"(echo "make $*" >> "$LOG"
[ -e "$FLAG/fail-make" ] && exit 2
for t in "$@"; do
  case "$t" in
    -*|SYSSRC=*|[0-9]*) ;;
    *) echo "object $t" > "$t" ;;
  esac
done
exit 0
)");

    cfg.tools.linker = tree.script("bin/ld", prologue() + R"(echo "ld $*" >> "$LOG"
[ -e "$FLAG/fail-ld" ] && exit 1
out=""
while [ $# -gt 0 ]; do
  if [ "$1" = "-o" ]; then out="$2"; shift; fi
  shift
done
[ -n "$out" ] || exit 1
echo "linked" > "$out"
)");

    cfg.tools.signer = tree.script("bin/sign-module", prologue() + R"(echo "sign $*" >> "$LOG"
[ -e "$FLAG/fail-sign" ] && exit 1
echo "signature $1" > "$3"
)");

    std::string unpackAll;
    std::string unpackLinked;
    for (const config::ModuleSpec& MOD : cfg.modules) {
      if (MOD.isLinked()) {
        unpackAll += "    put \"" + MOD.kernelInterface + "\"\n";
        unpackAll += "    put \"" + MOD.coreObject + "\"\n";
        unpackLinked += "      put \"" + MOD.fileName + "\"\n";
      } else {
        unpackAll += "    put \"" + MOD.fileName + "\"\n";
      }
    }
    cfg.tools.packager = tree.script(
        "bin/mkprecompiled",
        prologue() + R"SH(echo "mkprecompiled $*" >> "$LOG"
put() { mkdir -p "$(dirname "$out/$1")" && echo "data $1" > "$out/$1"; }
case "$1" in
  --pack)
    [ -e "$FLAG/fail-pack" ] && exit 1
    echo "$*" > "$2"
    ;;
  --unpack)
    [ -e "$FLAG/fail-unpack" ] && exit 1
    out="$4"
    mkdir -p "$out"
)SH" + unpackAll + R"(    if [ ! -e "$FLAG/unpack-without-linked" ]; then
)" + unpackLinked + R"(    fi
    ;;
  --match)
    if [ -e "$FLAG/fail-match" ]; then
      echo "kernel interface does not match."
    else
      echo "kernel interface matches."
    fi
    ;;
  *)
    exit 1
    ;;
esac
exit 0
)");

    cfg.tools.provisioner = tree.script("bin/provision", loggingTool("provision", "provision"));
    cfg.tools.modprobe = tree.script("bin/modprobe", loggingTool("modprobe", "modprobe"));
    cfg.tools.depmod = tree.script("bin/depmod", loggingTool("depmod", "depmod"));
    cfg.tools.persistenced =
        tree.script("bin/nvidia-persistenced", loggingTool("persistenced", "persistenced"));
  }
};

} // namespace test
} // namespace keeper

#endif // KEEPER_CONFIG_FAKE_HOST_HPP
