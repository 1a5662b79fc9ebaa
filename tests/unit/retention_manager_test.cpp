#include "retention_manager.hpp"

#include "fakes.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>

namespace {

namespace fs = std::filesystem;

using testing_support::FakeRemote;
using testing_support::QuietLogger;
using testing_support::TempDir;
using testing_support::WriteFile;

using Clock = std::chrono::system_clock;
using Days = std::chrono::duration<int, std::ratio<86400>>;

Clock::time_point Now() {
    return std::chrono::floor<std::chrono::seconds>(Clock::now());
}

void WriteAged(const fs::path& path, Clock::time_point mtime) {
    WriteFile(path, "archive");
    fs::last_write_time(path, std::chrono::file_clock::from_sys(mtime));
}

void TestOnlyStrictlyOlderArchivesAreDeleted() {
    TempDir dir;
    auto logger = QuietLogger(dir);
    InFlightArchives inFlight;
    const auto now = Now();
    fs::path root = dir.path() / "archives";

    WriteAged(root / "job-a/db_old.tar.gz.enc", now - Days(7) - std::chrono::seconds(1));
    WriteAged(root / "job-b/db_boundary.tar.gz.enc", now - Days(7));
    WriteAged(root / "job-c/db_fresh.tar.gz.enc", now - Days(1));
    WriteAged(root / "job-a/notes.txt", now - Days(30));

    RetentionManager retention(root.string(), nullptr, "backups", inFlight, *logger);
    assert(retention.prune(RetentionScope::Local, 7, now) == 1);

    assert(!fs::exists(root / "job-a/db_old.tar.gz.enc"));
    assert(fs::exists(root / "job-b/db_boundary.tar.gz.enc"));
    assert(fs::exists(root / "job-c/db_fresh.tar.gz.enc"));
    assert(fs::exists(root / "job-a/notes.txt"));
}

void TestEmptyJobDirectoriesRemovedUnlessInFlight() {
    TempDir dir;
    auto logger = QuietLogger(dir);
    InFlightArchives inFlight;
    const auto now = Now();
    fs::path root = dir.path() / "archives";

    WriteAged(root / "job-a/db_old.tar.gz.enc", now - Days(10));
    fs::create_directories(root / "job-running");
    InFlightGuard running(inFlight, "job-running");

    RetentionManager retention(root.string(), nullptr, "backups", inFlight, *logger);
    assert(retention.prune(RetentionScope::Local, 7, now) == 1);
    assert(!fs::exists(root / "job-a"));
    assert(fs::exists(root / "job-running"));
}

void TestInFlightArchiveIsSkipped() {
    TempDir dir;
    auto logger = QuietLogger(dir);
    InFlightArchives inFlight;
    const auto now = Now();
    fs::path root = dir.path() / "archives";
    WriteAged(root / "job-a/db_old.tar.gz.enc", now - Days(10));

    {
        InFlightGuard guard(inFlight, "db_old.tar.gz.enc");
        assert(inFlight.contains("db_old.tar.gz.enc"));
        RetentionManager retention(root.string(), nullptr, "backups", inFlight, *logger);
        assert(retention.prune(RetentionScope::Local, 7, now) == 0);
        assert(fs::exists(root / "job-a/db_old.tar.gz.enc"));
    }
    assert(!inFlight.contains("db_old.tar.gz.enc"));
}

void TestRemoteArchivesPruned() {
    TempDir dir;
    auto logger = QuietLogger(dir);
    InFlightArchives inFlight;
    const auto now = Now();
    FakeRemote remote(dir.path() / "remote");
    fs::path remoteDir = dir.path() / "remote/backups";
    WriteAged(remoteDir / "db_old.tar.gz.enc", now - Days(8));
    WriteAged(remoteDir / "db_new.tar.gz.enc", now - Days(2));
    WriteAged(remoteDir / "web_old.tar.gz.enc", now - Days(8));
    remote.removeFails.insert("web_old.tar.gz.enc");

    RetentionManager retention(dir.str("archives"), &remote, "backups", inFlight, *logger);
    assert(retention.prune(RetentionScope::Remote, 7, now) == 1);
    assert(!fs::exists(remoteDir / "db_old.tar.gz.enc"));
    assert(fs::exists(remoteDir / "db_new.tar.gz.enc"));
    // A failed deletion is a warning; the sweep continues.
    assert(fs::exists(remoteDir / "web_old.tar.gz.enc"));
    assert(remote.removeCalls == 2);
}

void TestRemoteListingFailureIsNotFatal() {
    TempDir dir;
    auto logger = QuietLogger(dir);
    InFlightArchives inFlight;
    const auto now = Now();
    FakeRemote remote(dir.path() / "remote");
    remote.listFails = true;
    WriteAged(dir.path() / "archives/job-a/db_old.tar.gz.enc", now - Days(9));

    RetentionManager retention(dir.str("archives"), &remote, "backups", inFlight, *logger);
    assert(retention.prune(RetentionScope::Both, 7, now) == 1);
}

void TestArchiveNames() {
    assert(isArchiveName("db_20260101_030000.tar.gz.enc"));
    assert(!isArchiveName(".enc"));
    assert(!isArchiveName("db.tar.gz"));
    assert(toString(RetentionScope::Remote) == "remote");
}

}  // namespace

int main() {
    TestOnlyStrictlyOlderArchivesAreDeleted();
    TestEmptyJobDirectoriesRemovedUnlessInFlight();
    TestInFlightArchiveIsSkipped();
    TestRemoteArchivesPruned();
    TestRemoteListingFailureIsNotFatal();
    TestArchiveNames();

    std::cout << "retention_manager_test: pass\n";
    return 0;
}
