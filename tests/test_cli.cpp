/************************************************
 PDFgate: implemented in C
 See LICENSE

 Tests for the pdfgate command.
 Each test runs the built program in a scratch HOME and
 checks its exit code and report.
   0 = every input passed
   1 = usage or configuration error
   2 = at least one input rejected or skipped
 ************************************************/
#include <gtest/gtest.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>
#include <sys/wait.h>
#include <string>
#include <vector>

#ifndef PDFGATE_BIN
#error "PDFGATE_BIN must name the pdfgate executable"
#endif

class CliTest : public ::testing::Test {
protected:
  char Dir[64];
  std::vector<std::string> Files;
  std::string Output;

  void SetUp() override
    {
    strcpy(Dir,"/tmp/pdfgate_cliXXXXXX");
    ASSERT_NE(mkdtemp(Dir), (char*)NULL);
    }

  void TearDown() override
    {
    for(size_t i=0; i < Files.size(); i++) { unlink(Files[i].c_str()); }
    rmdir(Dir);
    }

  std::string WriteFile(const char *Name, const std::string &Data)
    {
    std::string Path = std::string(Dir) + "/" + Name;
    FILE *fp = fopen(Path.c_str(),"wb");
    if (fp)
      {
      fwrite(Data.data(),1,Data.size(),fp);
      fclose(fp);
      }
    Files.push_back(Path);
    return(Path);
    }

  // Run pdfgate; stdout and stderr are captured in Output.
  int Run(const std::string &Args)
    {
    std::string Log = std::string(Dir) + "/output.txt";
    std::string Cmd = "HOME='" + std::string(Dir) + "' '" PDFGATE_BIN "' " + Args + " > '" + Log + "' 2>&1";
    int rc = system(Cmd.c_str());
    Output.clear();
    FILE *fp = fopen(Log.c_str(),"rb");
    if (fp)
      {
      char Buf[4096];
      size_t n;
      while((n = fread(Buf,1,sizeof(Buf),fp)) > 0) { Output.append(Buf,n); }
      fclose(fp);
      }
    unlink(Log.c_str());
    if ((rc == -1) || !WIFEXITED(rc)) { return(-1); }
    return(WEXITSTATUS(rc));
    }

  bool Says(const char *Text) { return(Output.find(Text) != std::string::npos); }
};

namespace {
const char *CleanDoc = "%PDF-1.4\n1 0 obj\n<</Type/Catalog/Pages 2 0 R>>\nendobj\ntrailer\n<</Root 1 0 R>>\n%%EOF\n";
const char *ScriptDoc = "%PDF-1.4\n1 0 obj\n<</Type/Catalog/OpenAction<</S/JavaScript/JS(app.alert(1))>>>>\nendobj\n";
const char *LinkDoc = "%PDF-1.4\n1 0 obj\n<</S/URI/URI(https://example.com/)>>\nendobj\n";
} // namespace

// ============================================================================
// Exit status
// ============================================================================

TEST_F(CliTest, CleanFilePasses) {
  std::string Clean = WriteFile("clean.pdf",CleanDoc);
  EXPECT_EQ(Run("'" + Clean + "'"), 0) << Output;
  EXPECT_TRUE(Says(("[" + Clean + "]\n").c_str())) << Output;
  EXPECT_TRUE(Says(" sha256: ")) << Output;
  EXPECT_TRUE(Says(" PASS")) << Output;
}

TEST_F(CliTest, ScriptFileIsRejected) {
  std::string Bad = WriteFile("script.pdf",ScriptDoc);
  EXPECT_EQ(Run("'" + Bad + "'"), 2) << Output;
  EXPECT_TRUE(Says(" FAIL: ScriptDetected (JavaScript detected in PDF) signature=/\\s*JavaScript")) << Output;
}

TEST_F(CliTest, AnyRejectionFailsTheRun) {
  std::string Clean = WriteFile("clean.pdf",CleanDoc);
  std::string Link = WriteFile("link.pdf",LinkDoc);
  EXPECT_EQ(Run("'" + Clean + "' '" + Link + "'"), 2) << Output;
  EXPECT_TRUE(Says(" PASS")) << Output;
  EXPECT_TRUE(Says(" FAIL: ExternalRefDetected")) << Output;
}

TEST_F(CliTest, NotAPDFIsRejected) {
  std::string Text = WriteFile("notes.txt","just some text\n");
  EXPECT_EQ(Run("'" + Text + "'"), 2) << Output;
  EXPECT_TRUE(Says(" FAIL: InvalidStructure")) << Output;
}

TEST_F(CliTest, MissingFileIsSkipped) {
  EXPECT_EQ(Run("'" + std::string(Dir) + "/missing.pdf'"), 2) << Output;
  EXPECT_TRUE(Says("ERROR: Unknown file")) << Output;
}

TEST_F(CliTest, QuietHidesPasses) {
  std::string Clean = WriteFile("clean.pdf",CleanDoc);
  EXPECT_EQ(Run("-q '" + Clean + "'"), 0) << Output;
  EXPECT_EQ(Output, "");

  std::string Bad = WriteFile("script.pdf",ScriptDoc);
  EXPECT_EQ(Run("-q '" + Clean + "' '" + Bad + "'"), 2) << Output;
  EXPECT_FALSE(Says(" PASS")) << Output;
  EXPECT_TRUE(Says(" FAIL: ScriptDetected")) << Output;
}

TEST_F(CliTest, DigestAlgorithmOption) {
  std::string Clean = WriteFile("clean.pdf",CleanDoc);
  EXPECT_EQ(Run("--digestalg sha512 '" + Clean + "'"), 0) << Output;
  EXPECT_TRUE(Says(" sha512: ")) << Output;
}

// ============================================================================
// Size limit
// ============================================================================

TEST_F(CliTest, MaxsizeSkipsLargeFiles) {
  std::string Clean = WriteFile("clean.pdf",CleanDoc);
  EXPECT_EQ(Run("-m 16 '" + Clean + "'"), 2) << Output;
  EXPECT_TRUE(Says("ERROR: File exceeds maxsize")) << Output;
  EXPECT_FALSE(Says(" PASS")) << Output;
}

TEST_F(CliTest, MaxsizeAllowsSmallFiles) {
  std::string Clean = WriteFile("clean.pdf",CleanDoc);
  EXPECT_EQ(Run("--maxsize 4096 '" + Clean + "'"), 0) << Output;
}

// ============================================================================
// Usage and configuration errors
// ============================================================================

TEST_F(CliTest, NoInputsIsAnError) {
  EXPECT_EQ(Run(""), 1) << Output;
  EXPECT_TRUE(Says("ERROR: No input files.")) << Output;
}

TEST_F(CliTest, BadOptionValueIsAnError) {
  std::string Clean = WriteFile("clean.pdf",CleanDoc);
  EXPECT_EQ(Run("--maxsize 10MB '" + Clean + "'"), 1) << Output;
  EXPECT_EQ(Run("--digestalg md5 '" + Clean + "'"), 1) << Output;
}

TEST_F(CliTest, HelpExitsWithUsage) {
  EXPECT_EQ(Run("-h"), 1) << Output;
  EXPECT_TRUE(Says("Usage:")) << Output;
}

TEST_F(CliTest, VersionExitsCleanly) {
  EXPECT_EQ(Run("--version"), 0) << Output;
  EXPECT_FALSE(Output.empty());
}

TEST_F(CliTest, MissingConfigOptionIsAnError) {
  EXPECT_EQ(Run("--config '" + std::string(Dir) + "/none.cfg' -W"), 1) << Output;
  EXPECT_TRUE(Says("Configuration file not found")) << Output;
}

TEST_F(CliTest, UnknownConfigFieldIsAnError) {
  std::string Cfg = WriteFile("bad.cfg","color=blue\n");
  std::string Clean = WriteFile("clean.pdf",CleanDoc);
  EXPECT_EQ(Run("--config '" + Cfg + "' '" + Clean + "'"), 1) << Output;
  EXPECT_TRUE(Says("unknown field 'color'")) << Output;
}

TEST_F(CliTest, MalformedHomeConfigIsAnError) {
  WriteFile(".pdfgate.cfg","maxsize\n");
  std::string Clean = WriteFile("clean.pdf",CleanDoc);
  EXPECT_EQ(Run("'" + Clean + "'"), 1) << Output;
  EXPECT_TRUE(Says("missing '='")) << Output;
}

// ============================================================================
// Configuration dump
// ============================================================================

TEST_F(CliTest, WriteConfigShowsDefaults) {
  EXPECT_EQ(Run("-W"), 0) << Output;
  EXPECT_TRUE(Says("digestalg=sha256\n")) << Output;
  EXPECT_TRUE(Says("maxsize=0\n")) << Output;
  EXPECT_TRUE(Says("timeout=10\n")) << Output;
  EXPECT_TRUE(Says("#cacert=\n")) << Output;
  EXPECT_TRUE(Says("insecure=0\n")) << Output;
}

TEST_F(CliTest, WriteConfigShowsOptions) {
  EXPECT_EQ(Run("-A sha384 -m 1000 --cert-insecure -W"), 0) << Output;
  EXPECT_TRUE(Says("digestalg=sha384\n")) << Output;
  EXPECT_TRUE(Says("maxsize=1000\n")) << Output;
  EXPECT_TRUE(Says("insecure=1\n")) << Output;
}

TEST_F(CliTest, HomeConfigIsRead) {
  WriteFile(".pdfgate.cfg","# local settings\ndigestalg=sha224\ntimeout=5\n");
  EXPECT_EQ(Run("-W"), 0) << Output;
  EXPECT_TRUE(Says("digestalg=sha224\n")) << Output;
  EXPECT_TRUE(Says("timeout=5\n")) << Output;

  // Command-line options override the file
  EXPECT_EQ(Run("-t 60 -W"), 0) << Output;
  EXPECT_TRUE(Says("timeout=60\n")) << Output;
}

TEST_F(CliTest, WrittenConfigIsReadable) {
  EXPECT_EQ(Run("-A sha512 -m 2048 -W"), 0) << Output;
  std::string Cfg = WriteFile("saved.cfg",Output);
  EXPECT_EQ(Run("--config '" + Cfg + "' -W"), 0) << Output;
  EXPECT_TRUE(Says("digestalg=sha512\n")) << Output;
  EXPECT_TRUE(Says("maxsize=2048\n")) << Output;
}
