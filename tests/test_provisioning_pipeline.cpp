#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "common/build_error.hpp"
#include "descriptor/descriptor_parser.hpp"
#include "image/image_store.hpp"
#include "image/package_inventory.hpp"
#include "pipeline/provisioning_pipeline.hpp"
#include "fake_package_runner.hpp"
#include "sqlite_faults.hpp"

using stratum::BuildError;
using stratum::BuildErrorKind;
using stratum::IdentityPolicy;
using stratum::ImageRecord;
using stratum::PipelineOptions;
using stratum::ProvisioningPipeline;
using stratum::StepKind;
using stratum::StepStatus;

namespace {

std::string descriptorWithPackages(const std::string &packages)
{
    return "FROM andrius/asterisk:latest\n"
           "USER root\n"
           "RUN apt-get update && apt-get install -y " + packages
        + " && rm -rf /var/lib/apt/lists/*\n"
          "USER asterisk\n";
}

} // namespace

class ProvisioningPipelineTests : public QObject
{
    Q_OBJECT
private slots:
    void init();
    void cleanup();

    void testReferenceBuild();
    void testBaseImageIsUntouched();
    void testIdentityTransitions();
    void testNonexistentPackageFails();
    void testFailedCleanupLeavesNoPartialLayer();
    void testKeepFailedBuild();
    void testRebuildProducesEquivalentImage();
    void testUnresolvableBaseRunsNothing();
    void testLazyIdentityFailsAtRun();
    void testStrictIdentityFailsAtUser();
    void testStrictIdentitySeesEarlierLayers();
    void testDefaultUserWithoutUserStep();
    void testInvalidTagRejectedUpFront();
    void testObserverSeesEveryStep();
    void testStoreFailureRecordsNothing();

private:
    std::unique_ptr<QTemporaryDir> m_tempDir;
    std::filesystem::path m_stateDir;
    std::unique_ptr<stratum::ImageStore> m_store;
    stratum::testing::FakePackageRunner m_runner;
    ImageRecord m_base;

    size_t imageDirCount() const;
};

void ProvisioningPipelineTests::init()
{
    m_tempDir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_tempDir->isValid());
    qputenv("STRATUM_HOME", m_tempDir->path().toUtf8());

    const std::filesystem::path root(m_tempDir->path().toStdString());
    m_stateDir = root / "state";
    stratum::testing::makeBaseRootfs(root / "base");

    m_store = std::make_unique<stratum::ImageStore>(m_stateDir);
    m_base = m_store->importImage("andrius/asterisk", root / "base", "asterisk");
    m_runner = stratum::testing::FakePackageRunner{};
}

void ProvisioningPipelineTests::cleanup()
{
    m_store.reset();
    m_tempDir.reset();
}

size_t ProvisioningPipelineTests::imageDirCount() const
{
    size_t count = 0;
    for (const auto &entry : std::filesystem::directory_iterator(m_stateDir / "images")) {
        if (entry.is_directory()) {
            ++count;
        }
    }
    return count;
}

void ProvisioningPipelineTests::testReferenceBuild()
{
    ProvisioningPipeline pipeline(*m_store, m_runner);
    const auto descriptor = stratum::parseDescriptor(
        stratum::testing::referenceDescriptor(), "Containerfile");

    const ImageRecord image = pipeline.build(descriptor, {"asterisk-odbc"});

    QCOMPARE(image.parentId, m_base.id);
    QCOMPARE(image.defaultUser, std::string("asterisk"));
    QCOMPARE(image.source, std::string("Containerfile"));
    QVERIFY(image.packages.count("unixodbc"));
    QVERIFY(image.packages.count("odbc-mariadb"));
    QVERIFY(image.packages.count("asterisk"));
    QCOMPARE(image.layers.size(), size_t(1));
    QCOMPARE(image.layers[0].identity, std::string("root"));
    QCOMPARE(image.tags, std::vector<std::string>{"asterisk-odbc:latest"});

    // Package index caches are gone from the committed image.
    const std::filesystem::path lists = std::filesystem::path(image.rootfs) / "var/lib/apt/lists";
    QVERIFY(std::filesystem::is_directory(lists));
    QVERIFY(std::filesystem::is_empty(lists));
    QVERIFY(!std::filesystem::exists(m_store->imageDir(image.id) / "staging"));

    // The RUN step is one shell invocation as root, its sub-commands in order.
    QCOMPARE(m_runner.requests.size(), size_t(1));
    const auto &commands = m_runner.requests[0].commands;
    QCOMPARE(commands.size(), size_t(3));
    QCOMPARE(commands[0], std::string("apt-get update"));
    QVERIFY(commands[1].rfind("apt-get install -y", 0) == 0);
    QCOMPARE(commands[2], std::string("rm -rf /var/lib/apt/lists/*"));
    QCOMPARE(m_runner.requests[0].principal.uid, uint32_t(0));

    const auto stored = m_store->findByReference("asterisk-odbc");
    QVERIFY(stored.has_value());
    QCOMPARE(stored->id, image.id);
    QCOMPARE(stored->packages, image.packages);
}

void ProvisioningPipelineTests::testBaseImageIsUntouched()
{
    ProvisioningPipeline pipeline(*m_store, m_runner);
    pipeline.build(stratum::parseDescriptor(stratum::testing::referenceDescriptor(), "Containerfile"));

    const auto base = m_store->getImage(m_base.id);
    QVERIFY(base.has_value());
    QCOMPARE(base->defaultUser, std::string("asterisk"));
    const auto packages = stratum::readPackageInventory(base->rootfs);
    QVERIFY(!packages.count("unixodbc"));
    QVERIFY(std::filesystem::exists(std::filesystem::path(base->rootfs)
                                    / "var/lib/apt/lists/stale_InRelease"));
}

void ProvisioningPipelineTests::testIdentityTransitions()
{
    ProvisioningPipeline pipeline(*m_store, m_runner);
    pipeline.build(stratum::parseDescriptor(stratum::testing::referenceDescriptor(), "Containerfile"));

    const auto &results = pipeline.stepResults();
    QCOMPARE(results.size(), size_t(6));

    const std::vector<std::string> expected = {
        "asterisk", "root", "root", "root", "root", "asterisk"};
    for (size_t i = 0; i < results.size(); ++i) {
        QCOMPARE(results[i].index, i);
        QCOMPARE(results[i].status, StepStatus::Committed);
        QCOMPARE(results[i].identity, expected[i]);
    }
    QCOMPARE(results[3].kind, StepKind::Run);
    QCOMPARE(results[3].subResults.size(), size_t(3));
    QCOMPARE(pipeline.lastContext().effectiveIdentity, std::string("asterisk"));
}

void ProvisioningPipelineTests::testNonexistentPackageFails()
{
    ProvisioningPipeline pipeline(*m_store, m_runner);
    const auto descriptor = stratum::parseDescriptor(
        descriptorWithPackages("unixodbc nonexistent-pkg"), "Containerfile");

    try {
        pipeline.build(descriptor, {"broken"});
        QFAIL("expected the build to fail");
    } catch (const BuildError &error) {
        QCOMPARE(error.kind(), BuildErrorKind::CommandFailed);
        QCOMPARE(error.exitCode(), 100);
        QCOMPARE(error.line(), 3);
        QVERIFY(QString::fromStdString(error.what()).contains(QStringLiteral("non-zero code: 100")));
        QVERIFY(error.output().find("Unable to locate package nonexistent-pkg") != std::string::npos);
    }

    // The halting step is the last result; USER asterisk never ran.
    QCOMPARE(pipeline.stepResults().size(), size_t(2));
    QCOMPARE(pipeline.stepResults().back().status, StepStatus::Failed);
    QCOMPARE(pipeline.stepResults().back().subResults.size(), size_t(2));
    QCOMPARE(m_runner.requests.size(), size_t(1));

    QCOMPARE(m_store->listImages().size(), size_t(1));
    QVERIFY(!m_store->findByReference("broken").has_value());
    QCOMPARE(imageDirCount(), size_t(1));
}

void ProvisioningPipelineTests::testFailedCleanupLeavesNoPartialLayer()
{
    m_runner.failOnCommandContaining = "rm -rf";
    PipelineOptions options;
    options.keepFailedBuilds = true;
    ProvisioningPipeline pipeline(*m_store, m_runner, options);

    try {
        pipeline.build(stratum::parseDescriptor(stratum::testing::referenceDescriptor(),
                                                "Containerfile"));
        QFAIL("expected the build to fail");
    } catch (const BuildError &error) {
        QCOMPARE(error.kind(), BuildErrorKind::CommandFailed);
        QCOMPARE(error.exitCode(), 1);
        QCOMPARE(error.line(), 7);
    }

    // Install and update happened in staging only; the kept tree shows none of it.
    const std::filesystem::path kept =
        m_store->imageDir(pipeline.lastContext().buildId) / "rootfs";
    QVERIFY(std::filesystem::is_directory(kept));
    QVERIFY(!stratum::readPackageInventory(kept.string()).count("unixodbc"));
    QVERIFY(std::filesystem::exists(kept / "var/lib/apt/lists/stale_InRelease"));
    QVERIFY(!std::filesystem::exists(kept.parent_path() / "staging"));
    QCOMPARE(m_store->listImages().size(), size_t(1));
}

void ProvisioningPipelineTests::testKeepFailedBuild()
{
    m_runner.failOnCommandContaining = "apt-get update";

    ProvisioningPipeline discarding(*m_store, m_runner);
    QVERIFY_EXCEPTION_THROWN(
        discarding.build(stratum::parseDescriptor(stratum::testing::referenceDescriptor(),
                                                  "Containerfile")),
        BuildError);
    QCOMPARE(imageDirCount(), size_t(1));

    PipelineOptions options;
    options.keepFailedBuilds = true;
    ProvisioningPipeline keeping(*m_store, m_runner, options);
    QVERIFY_EXCEPTION_THROWN(
        keeping.build(stratum::parseDescriptor(stratum::testing::referenceDescriptor(),
                                               "Containerfile")),
        BuildError);
    QCOMPARE(imageDirCount(), size_t(2));
    QCOMPARE(m_store->listImages().size(), size_t(1));
}

void ProvisioningPipelineTests::testRebuildProducesEquivalentImage()
{
    ProvisioningPipeline pipeline(*m_store, m_runner);
    const auto descriptor = stratum::parseDescriptor(
        stratum::testing::referenceDescriptor(), "Containerfile");

    const ImageRecord first = pipeline.build(descriptor, {"asterisk-odbc"});
    const ImageRecord second = pipeline.build(descriptor, {"asterisk-odbc"});

    QVERIFY(first.id != second.id);
    QCOMPARE(first.packages, second.packages);
    QCOMPARE(first.defaultUser, second.defaultUser);
    QCOMPARE(second.parentId, m_base.id);

    // The tag moved to the newest image; the first one stays reachable by id.
    QCOMPARE(m_store->findByReference("asterisk-odbc")->id, second.id);
    QVERIFY(m_store->getImage(first.id).has_value());
    QVERIFY(m_store->getImage(first.id)->tags.empty());
}

void ProvisioningPipelineTests::testUnresolvableBaseRunsNothing()
{
    ProvisioningPipeline pipeline(*m_store, m_runner);
    const auto descriptor = stratum::parseDescriptor(
        "# comment\nFROM andrius/asterisk:18\nUSER root\nRUN true\n", "Containerfile");

    try {
        pipeline.build(descriptor, {"never"});
        QFAIL("expected the build to fail");
    } catch (const BuildError &error) {
        QCOMPARE(error.kind(), BuildErrorKind::UnresolvableBase);
        QCOMPARE(error.exitCode(), 1);
        QCOMPARE(error.line(), 2);
        QVERIFY(QString::fromStdString(error.what()).contains(QStringLiteral("andrius/asterisk:18")));
    }

    QVERIFY(m_runner.requests.empty());
    QVERIFY(pipeline.stepResults().empty());
    QCOMPARE(imageDirCount(), size_t(1));
    QCOMPARE(m_store->listImages().size(), size_t(1));
}

void ProvisioningPipelineTests::testLazyIdentityFailsAtRun()
{
    ProvisioningPipeline pipeline(*m_store, m_runner);
    const auto descriptor = stratum::parseDescriptor(
        "FROM andrius/asterisk\nUSER ghost\nRUN true\n", "Containerfile");

    try {
        pipeline.build(descriptor);
        QFAIL("expected the build to fail");
    } catch (const BuildError &error) {
        QCOMPARE(error.kind(), BuildErrorKind::UnknownIdentity);
        QCOMPARE(error.line(), 3);
        QVERIFY(QString::fromStdString(error.what()).contains(QStringLiteral("ghost")));
    }
    QCOMPARE(pipeline.stepResults().size(), size_t(2));
    QVERIFY(m_runner.requests.empty());
}

void ProvisioningPipelineTests::testStrictIdentityFailsAtUser()
{
    PipelineOptions options;
    options.identityPolicy = IdentityPolicy::Strict;
    ProvisioningPipeline pipeline(*m_store, m_runner, options);
    const auto descriptor = stratum::parseDescriptor(
        "FROM andrius/asterisk\nUSER ghost\nRUN true\n", "Containerfile");

    try {
        pipeline.build(descriptor);
        QFAIL("expected the build to fail");
    } catch (const BuildError &error) {
        QCOMPARE(error.kind(), BuildErrorKind::UnknownIdentity);
        QCOMPARE(error.line(), 2);
        QCOMPARE(error.exitCode(), 1);
    }
    QCOMPARE(pipeline.stepResults().size(), size_t(1));
    QVERIFY(m_runner.requests.empty());
}

void ProvisioningPipelineTests::testStrictIdentitySeesEarlierLayers()
{
    PipelineOptions options;
    options.identityPolicy = IdentityPolicy::Strict;
    ProvisioningPipeline pipeline(*m_store, m_runner, options);
    const auto descriptor = stratum::parseDescriptor(
        "FROM andrius/asterisk\nUSER root\nRUN useradd svc\nUSER svc\nRUN true\n",
        "Containerfile");

    const ImageRecord image = pipeline.build(descriptor);
    QCOMPARE(image.defaultUser, std::string("svc"));
    QCOMPARE(image.layers.size(), size_t(2));
    QCOMPARE(m_runner.requests.back().principal.uid, uint32_t(1001));
}

void ProvisioningPipelineTests::testDefaultUserWithoutUserStep()
{
    const std::filesystem::path root(m_tempDir->path().toStdString());
    m_store->importImage("debian:bookworm", root / "base", "");

    ProvisioningPipeline pipeline(*m_store, m_runner);
    const ImageRecord fromAsterisk = pipeline.build(
        stratum::parseDescriptor("FROM andrius/asterisk\nRUN true\n", "a"));
    QCOMPARE(fromAsterisk.defaultUser, std::string("asterisk"));
    QCOMPARE(m_runner.requests.back().principal.name, std::string("asterisk"));

    const ImageRecord fromDebian = pipeline.build(
        stratum::parseDescriptor("FROM debian:bookworm\nRUN true\n", "b"));
    QCOMPARE(fromDebian.defaultUser, std::string("root"));
    QCOMPARE(m_runner.requests.back().principal.uid, uint32_t(0));
}

void ProvisioningPipelineTests::testInvalidTagRejectedUpFront()
{
    ProvisioningPipeline pipeline(*m_store, m_runner);
    try {
        pipeline.build(stratum::parseDescriptor(stratum::testing::referenceDescriptor(),
                                                "Containerfile"),
                       {"not a tag"});
        QFAIL("expected the build to fail");
    } catch (const BuildError &error) {
        QCOMPARE(error.kind(), BuildErrorKind::Parse);
        QCOMPARE(error.exitCode(), 2);
    }
    QVERIFY(m_runner.requests.empty());
    QCOMPARE(imageDirCount(), size_t(1));
}

void ProvisioningPipelineTests::testObserverSeesEveryStep()
{
    ProvisioningPipeline pipeline(*m_store, m_runner);
    std::vector<int> lines;
    pipeline.setStepObserver([&lines](const stratum::Step &step, const stratum::StepResult &result) {
        QCOMPARE(step.line, result.line);
        lines.push_back(step.line);
    });

    pipeline.build(stratum::parseDescriptor(stratum::testing::referenceDescriptor(), "Containerfile"));
    QCOMPARE(lines, (std::vector<int>{3, 4, 6, 7, 12, 13}));
}

void ProvisioningPipelineTests::testStoreFailureRecordsNothing()
{
    QVERIFY(stratum::testing::rejectTagInsert(m_stateDir / "images.db", "broken:latest"));

    ProvisioningPipeline pipeline(*m_store, m_runner);
    const auto descriptor = stratum::parseDescriptor(
        stratum::testing::referenceDescriptor(), "Containerfile");
    QVERIFY_EXCEPTION_THROWN(pipeline.build(descriptor, {"good", "broken"}),
                             std::runtime_error);

    // Every step committed, but neither the image nor its first tag was kept.
    QCOMPARE(pipeline.stepResults().size(), size_t(6));
    QCOMPARE(m_store->listImages().size(), size_t(1));
    QVERIFY(!m_store->findByReference("good").has_value());
    QCOMPARE(imageDirCount(), size_t(1));
}

QTEST_MAIN(ProvisioningPipelineTests)
#include "test_provisioning_pipeline.moc"
