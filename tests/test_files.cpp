/************************************************
 PDFgate: implemented in C
 See LICENSE

 Tests for memory-mapped file access.
 ************************************************/
#include <gtest/gtest.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <string>

#include "gate.hpp"
#include "files.hpp"

class MmapFileTest : public ::testing::Test {
protected:
  char Path[64];

  void SetUp() override
    {
    strcpy(Path,"/tmp/pdfgate_filesXXXXXX");
    int fd = mkstemp(Path);
    ASSERT_NE(fd, -1);
    close(fd);
    }

  void TearDown() override { unlink(Path); }

  void WriteFile(const std::string &Data)
    {
    FILE *fp = fopen(Path,"wb");
    ASSERT_NE(fp, (FILE*)NULL);
    if (!Data.empty()) { ASSERT_EQ(fwrite(Data.data(),1,Data.size(),fp), Data.size()); }
    fclose(fp);
    }
};

TEST_F(MmapFileTest, MapsContents) {
  std::string Doc("%PDF-1.4\n\0binary\xff",17);
  WriteFile(Doc);

  mmapfile *Mmap = MmapFile(Path);
  ASSERT_NE(Mmap, (mmapfile*)NULL);
  ASSERT_EQ(Mmap->memsize, (uint64_t)Doc.size());
  EXPECT_EQ(memcmp(Mmap->mem,Doc.data(),Doc.size()), 0);
  MmapFree(Mmap);
}

TEST_F(MmapFileTest, ReadOnlyFile) {
  WriteFile("%PDF-1.4\n");
  ASSERT_EQ(chmod(Path,0444), 0);
  mmapfile *Mmap = MmapFile(Path);
  ASSERT_NE(Mmap, (mmapfile*)NULL);
  ASSERT_EQ(Mmap->memsize, 9u);
  EXPECT_EQ(memcmp(Mmap->mem,"%PDF-1.4\n",9), 0);
  MmapFree(Mmap);
}

TEST_F(MmapFileTest, EmptyFile) {
  WriteFile("");
  mmapfile *Mmap = MmapFile(Path);
  ASSERT_NE(Mmap, (mmapfile*)NULL);
  EXPECT_EQ(Mmap->memsize, 0u);
  EXPECT_EQ(Mmap->mem, (byte*)NULL);
  MmapFree(Mmap);
}

TEST_F(MmapFileTest, MissingFile) {
  EXPECT_EQ(MmapFile("/nonexistent/pdfgate/missing.pdf"), (mmapfile*)NULL);
  EXPECT_EQ(MmapFile(NULL), (mmapfile*)NULL);
}

TEST_F(MmapFileTest, DirectoryIsNotAFile) {
  EXPECT_EQ(MmapFile("/tmp"), (mmapfile*)NULL);
}

TEST_F(MmapFileTest, FreeNull) {
  MmapFree(NULL); // must not crash
}
