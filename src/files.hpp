/************************************************
 PDFgate: implemented in C
 See LICENSE

 General file and I/O handling.
 ************************************************/
#ifndef FILES_HPP
#define FILES_HPP

// C headers
#include <stdlib.h>
#include <stdio.h>
#include <unistd.h>

#include "gate.hpp"

#ifdef __CYGWIN__
  #define fstat64(a,b) fstat(a,b)
  #define mmap64(a,b,c,d,e,f) mmap(a,b,c,d,e,f)
  typedef struct stat stat_t;
#else
  typedef struct stat64 stat_t;
#endif

typedef struct
  {
  FILE *fp;
  byte *mem; // NULL when memsize is 0
  uint64_t memsize;
  } mmapfile;

mmapfile *	MmapFile	(const char *Filename); // read-only
void	MmapFree	(mmapfile *Mmap);

#endif
