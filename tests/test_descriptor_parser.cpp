#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <string>
#include <vector>

#include "common/build_error.hpp"
#include "descriptor/descriptor_parser.hpp"
#include "fake_package_runner.hpp"

using stratum::BuildError;
using stratum::BuildErrorKind;
using stratum::Descriptor;
using stratum::StepKind;

class DescriptorParserTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();

    void testReferenceDescriptor();
    void testContinuationKeepsCommandOnOneLine();
    void testCommentsBeforeFrom();
    void testCommentInsideContinuationIsDropped();
    void testEscapeDirective();
    void testExecForm();
    void testExecFormFallsBackToShellForm();
    void testKeywordsAreCaseInsensitive();
    void testParseErrors_data();
    void testParseErrors();
    void testMissingFile();
    void testSplitCompoundCommand_data();
    void testSplitCompoundCommand();
    void testNormalizeImageReference();
    void testShellQuote();

private:
    QTemporaryDir m_tempDir;
};

void DescriptorParserTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    qputenv("STRATUM_HOME", m_tempDir.path().toUtf8());
}

void DescriptorParserTests::testReferenceDescriptor()
{
    const Descriptor descriptor = stratum::parseDescriptor(
        stratum::testing::referenceDescriptor(), "Containerfile");

    QCOMPARE(descriptor.baseReference, std::string("andrius/asterisk:latest"));
    QCOMPARE(descriptor.baseLine, 1);
    QCOMPARE(descriptor.steps.size(), size_t(6));

    QCOMPARE(descriptor.steps[0].kind, StepKind::Comment);
    QCOMPARE(descriptor.steps[0].payload, std::string("Switch to root for package installation"));
    QCOMPARE(descriptor.steps[0].line, 3);

    QCOMPARE(descriptor.steps[1].kind, StepKind::SetUser);
    QCOMPARE(descriptor.steps[1].payload, std::string("root"));
    QCOMPARE(descriptor.steps[1].line, 4);

    QCOMPARE(descriptor.steps[2].kind, StepKind::Comment);

    const auto &run = descriptor.steps[3];
    QCOMPARE(run.kind, StepKind::Run);
    QCOMPARE(run.line, 7);
    QCOMPARE(run.subCommands.size(), size_t(3));
    QCOMPARE(run.subCommands[0], std::string("apt-get update"));
    QVERIFY(run.subCommands[1].rfind("apt-get install -y", 0) == 0);
    QVERIFY(run.subCommands[1].find("unixodbc") != std::string::npos);
    QVERIFY(run.subCommands[1].find("odbc-mariadb") != std::string::npos);
    QCOMPARE(run.subCommands[2], std::string("rm -rf /var/lib/apt/lists/*"));

    QCOMPARE(descriptor.steps[4].kind, StepKind::Comment);
    QCOMPARE(descriptor.steps[5].kind, StepKind::SetUser);
    QCOMPARE(descriptor.steps[5].payload, std::string("asterisk"));
    QCOMPARE(descriptor.steps[5].line, 13);
}

void DescriptorParserTests::testContinuationKeepsCommandOnOneLine()
{
    const Descriptor descriptor = stratum::parseDescriptor(
        "FROM base\nRUN echo one \\\n  two\n", "inline");

    QCOMPARE(descriptor.steps.size(), size_t(1));
    QCOMPARE(descriptor.steps[0].payload, std::string("echo one   two"));
    QCOMPARE(descriptor.steps[0].line, 2);
    QVERIFY(descriptor.steps[0].payload.find('\n') == std::string::npos);
}

void DescriptorParserTests::testCommentsBeforeFrom()
{
    const Descriptor descriptor = stratum::parseDescriptor(
        "# header\nFROM base:1\n", "inline");

    QCOMPARE(descriptor.baseReference, std::string("base:1"));
    QCOMPARE(descriptor.baseLine, 2);
    QCOMPARE(descriptor.steps.size(), size_t(1));
    QCOMPARE(descriptor.steps[0].kind, StepKind::Comment);
    QCOMPARE(descriptor.steps[0].payload, std::string("header"));
}

void DescriptorParserTests::testCommentInsideContinuationIsDropped()
{
    const Descriptor descriptor = stratum::parseDescriptor(
        "FROM base\n"
        "RUN apt-get install -y \\\n"
        "# pinned below\n"
        "    curl\n",
        "inline");

    QCOMPARE(descriptor.steps.size(), size_t(1));
    QCOMPARE(descriptor.steps[0].kind, StepKind::Run);
    QVERIFY(descriptor.steps[0].payload.find("curl") != std::string::npos);
    QVERIFY(descriptor.steps[0].payload.find("pinned") == std::string::npos);
}

void DescriptorParserTests::testEscapeDirective()
{
    const Descriptor descriptor = stratum::parseDescriptor(
        "# escape=`\n"
        "FROM base\n"
        "RUN echo a \\b `\n"
        "  && echo c\n",
        "inline");

    // The directive is consumed and is not a comment step.
    QCOMPARE(descriptor.steps.size(), size_t(1));
    QCOMPARE(descriptor.steps[0].subCommands.size(), size_t(2));
    QCOMPARE(descriptor.steps[0].subCommands[0], std::string("echo a \\b"));
    QCOMPARE(descriptor.steps[0].subCommands[1], std::string("echo c"));
}

void DescriptorParserTests::testExecForm()
{
    const Descriptor descriptor = stratum::parseDescriptor(
        "FROM base\nRUN [\"echo\", \"hello world\", \"a&&b\"]\n", "inline");

    QCOMPARE(descriptor.steps.size(), size_t(1));
    QCOMPARE(descriptor.steps[0].subCommands.size(), size_t(1));
    QCOMPARE(descriptor.steps[0].subCommands[0],
             std::string("echo 'hello world' 'a&&b'"));
}

void DescriptorParserTests::testExecFormFallsBackToShellForm()
{
    const Descriptor descriptor = stratum::parseDescriptor(
        "FROM base\nRUN [ -f /etc/passwd ] && echo yes\n", "inline");

    QCOMPARE(descriptor.steps[0].subCommands.size(), size_t(2));
    QCOMPARE(descriptor.steps[0].subCommands[0], std::string("[ -f /etc/passwd ]"));
}

void DescriptorParserTests::testKeywordsAreCaseInsensitive()
{
    const Descriptor descriptor = stratum::parseDescriptor(
        "from base\nuser nobody\nrun true\n", "inline");

    QCOMPARE(descriptor.baseReference, std::string("base:latest"));
    QCOMPARE(descriptor.steps[0].kind, StepKind::SetUser);
    QCOMPARE(descriptor.steps[1].kind, StepKind::Run);
}

void DescriptorParserTests::testParseErrors_data()
{
    QTest::addColumn<QString>("text");
    QTest::addColumn<int>("line");
    QTest::addColumn<QString>("message");

    QTest::newRow("no from") << "# only a comment\n" << 0
                             << "no FROM instruction found";
    QTest::newRow("user before from") << "USER root\nFROM base\n" << 1
                                      << "instruction USER found before FROM";
    QTest::newRow("unknown instruction") << "FROM base\nCOPY a b\n" << 2
                                         << "unknown instruction: COPY";
    QTest::newRow("multiple from") << "FROM a\nFROM b\n" << 2
                                   << "multiple FROM instructions are not supported";
    QTest::newRow("from options") << "FROM --platform=linux/amd64 base\n" << 1
                                  << "FROM options are not supported";
    QTest::newRow("from alias") << "FROM base AS build\n" << 1
                                << "FROM takes exactly one image reference";
    QTest::newRow("bad reference") << "FROM Bad//Ref\n" << 1
                                   << "invalid image reference";
    QTest::newRow("empty user") << "FROM base\nUSER\n" << 2
                                << "USER requires a principal";
    QTest::newRow("two users") << "FROM base\nUSER a b\n" << 2
                               << "USER takes a single principal";
    QTest::newRow("empty run") << "FROM base\nRUN\n" << 2
                               << "RUN requires a command";
    QTest::newRow("empty exec form") << "FROM base\nRUN []\n" << 2
                                     << "exec form RUN needs a non-empty array of strings";
    QTest::newRow("trailing continuation") << "FROM base\nRUN echo \\\n" << 2
                                           << "unexpected end of file after line continuation";
    QTest::newRow("bad escape") << "# escape=x\nFROM base\n" << 1
                                << "invalid escape token";
}

void DescriptorParserTests::testParseErrors()
{
    QFETCH(QString, text);
    QFETCH(int, line);
    QFETCH(QString, message);

    try {
        stratum::parseDescriptor(text.toStdString(), "Containerfile");
        QFAIL("expected a parse error");
    } catch (const BuildError &error) {
        QCOMPARE(error.kind(), BuildErrorKind::Parse);
        QCOMPARE(error.exitCode(), 2);
        QCOMPARE(error.line(), line);
        const QString what = QString::fromStdString(error.what());
        QVERIFY2(what.contains(message), qPrintable(what));
        QVERIFY(what.startsWith(QStringLiteral("Containerfile:%1:").arg(line)));
    }
}

void DescriptorParserTests::testMissingFile()
{
    const std::string path = (m_tempDir.path() + "/missing/Containerfile").toStdString();
    try {
        stratum::parseDescriptorFile(path);
        QFAIL("expected a parse error");
    } catch (const BuildError &error) {
        QCOMPARE(error.kind(), BuildErrorKind::Parse);
        QCOMPARE(error.exitCode(), 2);
    }
}

void DescriptorParserTests::testSplitCompoundCommand_data()
{
    QTest::addColumn<QString>("command");
    QTest::addColumn<QStringList>("expected");

    QTest::newRow("single") << "apt-get update" << QStringList{"apt-get update"};
    QTest::newRow("and list") << "a && b&&c" << QStringList{"a", "b", "c"};
    QTest::newRow("quoted operator") << "echo 'x && y' && echo \"p && q\""
                                     << QStringList{"echo 'x && y'", "echo \"p && q\""};
    QTest::newRow("redirect") << "make 2>&1 && echo ok"
                              << QStringList{"make 2>&1", "echo ok"};
    QTest::newRow("or list") << "a && b || c" << QStringList{"a && b || c"};
    QTest::newRow("sequence") << "a && b; c" << QStringList{"a && b; c"};
    QTest::newRow("background") << "a & b" << QStringList{"a & b"};
    QTest::newRow("subshell") << "(a && b) && c" << QStringList{"(a && b)", "c"};
    QTest::newRow("substitution") << "echo $(a && b) && c"
                                  << QStringList{"echo $(a && b)", "c"};
    QTest::newRow("quoted substitution") << "echo \"$(a && b)\" && c"
                                         << QStringList{"echo \"$(a && b)\" && c"};
    QTest::newRow("group") << "{ a && b; } && c" << QStringList{"{ a && b; } && c"};
    QTest::newRow("double bracket test") << "[[ -d / && -d /tmp ]] && echo both"
                                         << QStringList{"[[ -d / && -d /tmp ]] && echo both"};
    QTest::newRow("single bracket test") << "[ -d / ] && echo yes"
                                         << QStringList{"[ -d / ]", "echo yes"};
    QTest::newRow("heredoc") << "cat <<EOF && b" << QStringList{"cat <<EOF && b"};
    QTest::newRow("comment") << "a && b # && c" << QStringList{"a && b # && c"};
    QTest::newRow("dangling operator") << "a &&" << QStringList{"a &&"};
    QTest::newRow("unbalanced quote") << "echo 'a && b" << QStringList{"echo 'a && b"};
}

void DescriptorParserTests::testSplitCompoundCommand()
{
    QFETCH(QString, command);
    QFETCH(QStringList, expected);

    const auto parts = stratum::splitCompoundCommand(command.toStdString());
    QStringList actual;
    for (const auto &part : parts) {
        actual.push_back(QString::fromStdString(part));
    }
    QCOMPARE(actual, expected);
}

void DescriptorParserTests::testNormalizeImageReference()
{
    QCOMPARE(stratum::normalizeImageReference("andrius/asterisk"),
             std::string("andrius/asterisk:latest"));
    QCOMPARE(stratum::normalizeImageReference("debian:bookworm"),
             std::string("debian:bookworm"));
    QCOMPARE(stratum::normalizeImageReference("registry:5000/team/app"),
             std::string("registry:5000/team/app:latest"));
    QCOMPARE(stratum::normalizeImageReference("app@sha256:abcdef"),
             std::string("app@sha256:abcdef"));

    QVERIFY(stratum::isValidImageReference("registry:5000/team/app:1.2"));
    QVERIFY(!stratum::isValidImageReference(":latest"));
    QVERIFY(!stratum::isValidImageReference("a b"));
}

void DescriptorParserTests::testShellQuote()
{
    QCOMPARE(stratum::shellQuote("/usr/bin/env"), std::string("/usr/bin/env"));
    QCOMPARE(stratum::shellQuote("a b"), std::string("'a b'"));
    QCOMPARE(stratum::shellQuote("it's"), std::string("'it'\\''s'"));
}

QTEST_MAIN(DescriptorParserTests)
#include "test_descriptor_parser.moc"
