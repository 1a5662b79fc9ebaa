#include "backup.hpp"

#include "fakes.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include <sys/stat.h>

namespace {

namespace fs = std::filesystem;

using testing_support::FailingArchiver;
using testing_support::FakeConfigExport;
using testing_support::FakeContainerRuntime;
using testing_support::FakeRemote;
using testing_support::QuietLogger;
using testing_support::ReadFile;
using testing_support::TempDir;
using testing_support::TestConfig;
using testing_support::WriteFile;

const std::map<std::string, std::string> kEnabled{{"backup.enable", "true"}};

std::map<std::string, std::string> ProjectLabels(const std::string& project) {
    return {{"backup.enable", "true"}, {"com.docker.compose.project", project}};
}

// Non-owning handles to the strategies a Backup owns.
struct Fixture {
    explicit Fixture(TempDir& dir) : dir(dir), logger(QuietLogger(dir)), config(TestConfig(dir)) {
        auto runtimeOwner = std::make_unique<FakeContainerRuntime>();
        runtime = runtimeOwner.get();
        components.runtime = std::move(runtimeOwner);
        components.archiver = std::make_unique<TarEncryptArchiveStrategy>(ArchiveOptions{"gzip", 1, 1000});
    }

    FakeRemote* UseRemote() {
        auto remoteOwner = std::make_unique<FakeRemote>(dir.path() / "remote");
        FakeRemote* remote = remoteOwner.get();
        components.transfer = std::move(remoteOwner);
        return remote;
    }

    FakeConfigExport* UseConfigExport() {
        auto exportOwner = std::make_unique<FakeConfigExport>();
        FakeConfigExport* configExport = exportOwner.get();
        components.configExport = std::move(exportOwner);
        return configExport;
    }

    std::string DataDir(const std::string& name) {
        fs::path path = dir.path() / "volumes" / name;
        WriteFile(path / "data.bin", "payload of " + name);
        return path.string();
    }

    std::string BrokenDir(const std::string& name) {
        fs::path path = dir.path() / "volumes" / name;
        fs::create_directories(path.parent_path());
        int made = ::mkfifo(path.c_str(), 0600);
        assert(made == 0);
        return path.string();
    }

    HistoryEntry Run(const std::string& target, bool cancelFirst = false) {
        backup = std::make_unique<Backup>(config, std::move(components), *logger, inFlight);
        BackupJob job;
        job.id = "job-" + std::to_string(++sequence);
        job.target = target;
        job.kind = kindForTarget(target);
        job.startedAt = std::chrono::system_clock::now();
        if (cancelFirst) {
            bool cancelled = job.cancellation.requestCancel();
            assert(cancelled);
        }
        HistoryEntry entry = backup->execute(job);
        assert(job.phase.load() == JobPhase::Completed);
        return entry;
    }

    fs::path ArchivePath(const HistoryEntry& entry) const {
        return fs::path(config.archiveDir()) / entry.jobId / entry.archiveName;
    }

    TempDir& dir;
    std::unique_ptr<Logger> logger;
    BackupConfig config;
    BackupComponents components;
    FakeContainerRuntime* runtime = nullptr;
    InFlightArchives inFlight;
    std::unique_ptr<Backup> backup;
    int sequence = 0;
};

void TestProjectBackupKeptLocallyWithoutRemote() {
    TempDir dir;
    Fixture fixture(dir);
    fixture.runtime->AddContainer("c1", "db", kEnabled, {fixture.DataDir("db")});

    HistoryEntry entry = fixture.Run("db");
    assert(entry.status == JobStatus::Success);
    assert(!entry.error.has_value());
    assert(entry.archiveName.starts_with("db_"));
    assert(entry.archiveName.ends_with(".tar.gz.enc"));
    assert(entry.archiveRetainedLocally);
    assert(entry.checksum.size() == 64);
    assert(fs::file_size(fixture.ArchivePath(entry)) == entry.archiveSize);
    assert(fixture.runtime->IsRunning("c1"));
    assert(!fs::exists(fs::path(fixture.config.stagingDir()) / entry.jobId));

    auto restored = fixture.backup->restore(fixture.ArchivePath(entry).string(), dir.str("restore"));
    assert(restored.has_value());
    assert(ReadFile(dir.path() / "restore/db/0_db/data.bin") == "payload of db");
}

void TestUploadedArchiveRemovedLocally() {
    TempDir dir;
    Fixture fixture(dir);
    FakeRemote* remote = fixture.UseRemote();
    fixture.runtime->AddContainer("c1", "db", kEnabled, {fixture.DataDir("db")});

    HistoryEntry entry = fixture.Run("db");
    assert(entry.status == JobStatus::Success);
    assert(!entry.archiveRetainedLocally);
    assert(!fs::exists(fixture.ArchivePath(entry)));
    assert(fs::exists(dir.path() / "remote/backups" / entry.archiveName));
    assert(remote->copyCalls == 1);
}

void TestCopyFailureRestartsAndFails() {
    TempDir dir;
    Fixture fixture(dir);
    fixture.runtime->AddContainer("c1", "db", kEnabled, {fixture.BrokenDir("db")});

    HistoryEntry entry = fixture.Run("db");
    assert(entry.status == JobStatus::Failed);
    assert(entry.error->kind == ErrorKind::Copy);
    assert(entry.archiveName.empty());
    assert(entry.failedWorkloads.size() == 1);
    assert(fixture.runtime->IsRunning("c1"));
    assert(fixture.runtime->startCalls == 1);
}

void TestCompressionFailureAfterRestart() {
    TempDir dir;
    Fixture fixture(dir);
    fixture.components.archiver = std::make_unique<FailingArchiver>();
    fixture.runtime->AddContainer("c1", "db", kEnabled, {fixture.DataDir("db")});

    HistoryEntry entry = fixture.Run("db");
    assert(entry.status == JobStatus::Failed);
    assert(entry.error->kind == ErrorKind::Compression);
    assert(fixture.runtime->IsRunning("c1"));
    std::vector<std::string> expected{"stop:c1", "start:c1"};
    assert(fixture.runtime->Events() == expected);
    assert(!fs::exists(fs::path(fixture.config.archiveDir()) / entry.jobId));
    assert(!fs::exists(fs::path(fixture.config.stagingDir()) / entry.jobId));
}

void TestUnverifiedUploadKeepsArchive() {
    TempDir dir;
    Fixture fixture(dir);
    FakeRemote* remote = fixture.UseRemote();
    remote->sizeSkew = 7;
    fixture.runtime->AddContainer("c1", "db", kEnabled, {fixture.DataDir("db")});

    HistoryEntry entry = fixture.Run("db");
    assert(entry.status == JobStatus::Failed);
    assert(entry.error->kind == ErrorKind::Upload);
    assert(entry.archiveRetainedLocally);
    assert(fs::exists(fixture.ArchivePath(entry)));
    assert(remote->copyCalls == fixture.config.remote.retries);
}

void TestFullSystemPartialFailure() {
    TempDir dir;
    Fixture fixture(dir);
    FakeConfigExport* configExport = fixture.UseConfigExport();
    fixture.runtime->AddContainer("c1", "nextcloud-app", ProjectLabels("nextcloud"), {fixture.DataDir("nc")});
    fixture.runtime->AddContainer("c2", "adguard", kEnabled, {fixture.BrokenDir("adguard")});
    fixture.runtime->AddContainer("c3", "scratch", kEnabled, {fixture.DataDir("scratch")});
    TargetConfig scratch;
    scratch.name = "scratch";
    scratch.enabled = false;
    fixture.config.targets.push_back(scratch);

    HistoryEntry entry = fixture.Run("all");
    assert(entry.kind == JobKind::FullSystem);
    assert(entry.status == JobStatus::Partial);
    assert(entry.error->kind == ErrorKind::Copy);
    assert(entry.failedWorkloads.size() == 1 && entry.failedWorkloads[0] == "adguard");
    assert(entry.archiveName.starts_with("full_system_"));
    assert(configExport->calls.load() == 1);
    assert(fixture.runtime->IsRunning("c1"));
    assert(fixture.runtime->IsRunning("c2"));
    // Disabled workloads are not touched by full-system jobs.
    for (const auto& event : fixture.runtime->Events()) {
        assert(event.find("c3") == std::string::npos);
    }

    auto restored = fixture.backup->restore(fixture.ArchivePath(entry).string(), dir.str("restore"));
    assert(restored.has_value());
    assert(fs::exists(dir.path() / "restore/nextcloud"));
    assert(fs::exists(dir.path() / "restore/_config/portainer/stacks.json"));
    assert(!fs::exists(dir.path() / "restore/scratch"));
}

void TestPortainerWorkloadKeptApartFromExport() {
    TempDir dir;
    Fixture fixture(dir);
    fixture.UseConfigExport();
    fixture.runtime->AddContainer("c1", "portainer", kEnabled, {fixture.DataDir("pt")});

    HistoryEntry entry = fixture.Run("all");
    assert(entry.status == JobStatus::Success);

    auto restored = fixture.backup->restore(fixture.ArchivePath(entry).string(), dir.str("restore"));
    assert(restored.has_value());
    // The workload keeps only its volume data; the export lives under its own directory.
    assert(ReadFile(dir.path() / "restore/portainer/0_pt/data.bin") == "payload of pt");
    assert(!fs::exists(dir.path() / "restore/portainer/stacks.json"));
    assert(ReadFile(dir.path() / "restore/_config/portainer/stacks.json") == "[]");
    assert(!fs::exists(dir.path() / "restore/_config/portainer/0_pt"));
}

void TestReservedWorkloadNamesSkipped() {
    TempDir dir;
    Fixture fixture(dir);
    fixture.runtime->AddContainer("c1", "all-app", ProjectLabels("all"), {fixture.DataDir("all")});
    fixture.runtime->AddContainer("c2", "db", kEnabled, {fixture.DataDir("db")});

    HistoryEntry entry = fixture.Run("all");
    assert(entry.status == JobStatus::Success);
    for (const auto& event : fixture.runtime->Events()) {
        assert(event.find("c1") == std::string::npos);
    }
    assert(ReadFile(dir.path() / "log/errors.log").find("reserved") != std::string::npos);
}

void TestRestartFailureIsCriticalFailure() {
    TempDir dir;
    Fixture fixture(dir);
    fixture.runtime->AddContainer("c1", "db", kEnabled, {fixture.DataDir("db")});
    fixture.runtime->AddContainer("c2", "web", kEnabled, {fixture.DataDir("web")});
    fixture.runtime->startFails.insert("c2");

    HistoryEntry entry = fixture.Run("all");
    assert(entry.status == JobStatus::Failed);
    assert(entry.error->kind == ErrorKind::RestartFailed);
    assert(entry.error->severity() == Severity::Critical);
    assert(entry.failedWorkloads.size() == 1 && entry.failedWorkloads[0] == "web");
    assert(fixture.runtime->IsRunning("c1"));
}

void TestFullSystemExportFailureIsPartial() {
    TempDir dir;
    Fixture fixture(dir);
    fixture.UseConfigExport()->fail = true;
    fixture.runtime->AddContainer("c1", "db", kEnabled, {fixture.DataDir("db")});

    HistoryEntry entry = fixture.Run("all");
    assert(entry.status == JobStatus::Partial);
    assert(entry.error->kind == ErrorKind::ConfigExport);
    assert(!entry.archiveName.empty());
}

void TestConfigOnlyJobs() {
    {
        TempDir dir;
        Fixture fixture(dir);
        HistoryEntry entry = fixture.Run("config");
        assert(entry.kind == JobKind::ConfigOnly);
        assert(entry.status == JobStatus::Failed);
        assert(entry.error->kind == ErrorKind::ConfigExport);
    }
    {
        TempDir dir;
        Fixture fixture(dir);
        fixture.UseConfigExport();
        fixture.runtime->AddContainer("c1", "db", kEnabled, {fixture.DataDir("db")});
        HistoryEntry entry = fixture.Run("config");
        assert(entry.status == JobStatus::Success);
        assert(entry.archiveName.starts_with("config_"));
        // Config exports never stop containers.
        assert(fixture.runtime->stopCalls == 0);
        assert(fixture.runtime->listCalls == 0);
    }
}

void TestJobsThatNeverStart() {
    {
        TempDir dir;
        Fixture fixture(dir);
        fixture.config.password.clear();
        fixture.runtime->AddContainer("c1", "db", kEnabled, {fixture.DataDir("db")});
        HistoryEntry entry = fixture.Run("db");
        assert(entry.status == JobStatus::Failed);
        assert(entry.error->kind == ErrorKind::Configuration);
        assert(fixture.runtime->stopCalls == 0);
    }
    {
        TempDir dir;
        Fixture fixture(dir);
        fixture.runtime->AddContainer("c1", "db", kEnabled, {fixture.DataDir("db")});
        HistoryEntry entry = fixture.Run("mail");
        assert(entry.status == JobStatus::Failed);
        assert(entry.error->kind == ErrorKind::Discovery);
    }
    {
        TempDir dir;
        Fixture fixture(dir);
        fixture.runtime->unreachable = true;
        HistoryEntry entry = fixture.Run("all");
        assert(entry.status == JobStatus::Failed);
        assert(entry.error->kind == ErrorKind::Discovery);
    }
    {
        TempDir dir;
        Fixture fixture(dir);
        fixture.runtime->AddContainer("c1", "db", kEnabled, {fixture.DataDir("db")});
        HistoryEntry entry = fixture.Run("db", true);
        assert(entry.status == JobStatus::Failed);
        assert(entry.error->kind == ErrorKind::Cancelled);
        assert(fixture.runtime->stopCalls == 0);
    }
}

void TestListWorkloadsReportsDisabledTargets() {
    TempDir dir;
    Fixture fixture(dir);
    fixture.runtime->AddContainer("c1", "db", kEnabled, {fixture.DataDir("db")});
    fixture.runtime->AddContainer("c2", "web", kEnabled, {fixture.DataDir("web")});
    TargetConfig web;
    web.name = "web";
    web.enabled = false;
    fixture.config.targets.push_back(web);
    fixture.backup = std::make_unique<Backup>(fixture.config, std::move(fixture.components), *fixture.logger,
                                              fixture.inFlight);

    auto workloads = fixture.backup->listWorkloads();
    assert(workloads.has_value());
    assert(workloads->size() == 2);
    assert((*workloads)[0].enabled);
    assert(!(*workloads)[1].enabled);
}

void TestMissingStrategiesRejected() {
    TempDir dir;
    auto logger = QuietLogger(dir);
    InFlightArchives inFlight;
    bool threw = false;
    try {
        Backup backup(TestConfig(dir), BackupComponents{}, *logger, inFlight);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    BackupConfig config = TestConfig(dir);
    config.remote.type = "s3";
    threw = false;
    try {
        makeComponents(config);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);

    config.remote.type = "none";
    BackupComponents components = makeComponents(config);
    assert(components.runtime && components.archiver);
    assert(!components.transfer);
    assert(!components.configExport);
}

}  // namespace

int main() {
    TestProjectBackupKeptLocallyWithoutRemote();
    TestUploadedArchiveRemovedLocally();
    TestCopyFailureRestartsAndFails();
    TestCompressionFailureAfterRestart();
    TestUnverifiedUploadKeepsArchive();
    TestFullSystemPartialFailure();
    TestPortainerWorkloadKeptApartFromExport();
    TestReservedWorkloadNamesSkipped();
    TestRestartFailureIsCriticalFailure();
    TestFullSystemExportFailureIsPartial();
    TestConfigOnlyJobs();
    TestJobsThatNeverStart();
    TestListWorkloadsReportsDisabledTargets();
    TestMissingStrategiesRejected();

    std::cout << "backup_test: pass\n";
    return 0;
}
