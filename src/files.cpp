/************************************************
 PDFgate: implemented in C
 See LICENSE

 General file and I/O handling.
 ************************************************/
// C headers
#include <stdlib.h>
#include <stdio.h>
#include <unistd.h>
#include <stdint.h>
#include <string.h>
#include <errno.h>
#include <sys/types.h> // stat()
#include <sys/stat.h> // stat()
#include <fcntl.h>
#ifndef __WIN32__
  #include <sys/mman.h> /* for mmap() */
#endif

#include "gate.hpp"
#include "files.hpp"

/**************************************
 MmapFile(): memory map the file (read-only) for quick access.
 Used for scanning without copying the file into memory.
 Empty files are permitted: mem is NULL and memsize is 0.
 Unlike a hard failure, a missing or unreadable file is
 reported and NULL is returned so the caller can skip it.
 Returns: mmapfile* or NULL.
 **************************************/
mmapfile *	MmapFile	(const char *Filename)
{
  mmapfile *Mmap;
  int FileHandle;

  if (!Filename) { return(NULL); }

  // allocate structure
  Mmap = (mmapfile*)calloc(sizeof(mmapfile),1);
  if (!Mmap) // should never happen
    {
    fprintf(stderr,"ERROR: Cannot allocate mmap structure\n");
    exit(1);
    }

  // Open file and check it
  Mmap->fp = fopen(Filename,"rb");
  if (!Mmap->fp)
    {
    if (Verbose) { fprintf(stderr,"ERROR: Cannot open file (%s): %s\n",Filename,strerror(errno)); }
    free(Mmap);
    return(NULL);
    }

  // mmap requires file handle
  FileHandle = fileno(Mmap->fp);
  if (FileHandle == -1) // should never happen since fopen worked
    {
    fprintf(stderr,"ERROR: File inaccessible (%s)\n",Filename);
    fclose(Mmap->fp);
    free(Mmap);
    return(NULL);
    }

  stat_t Stat;
  if ((fstat64(FileHandle,&Stat) == -1) || !S_ISREG(Stat.st_mode))
    {
    if (Verbose) { fprintf(stderr,"ERROR: Not a regular file (%s)\n",Filename); }
    fclose(Mmap->fp);
    free(Mmap);
    return(NULL);
    }

  // mmap() refuses zero-length maps
  Mmap->memsize = Stat.st_size;
  if (Mmap->memsize == 0) { return(Mmap); }

  Mmap->mem = (byte *)mmap64(0,Mmap->memsize,PROT_READ,MAP_SHARED,FileHandle,0);
  if (!Mmap->mem || (Mmap->mem == MAP_FAILED))
    {
    fprintf(stderr,"ERROR: Memory map failed for file (%s)\n",Filename);
    fclose(Mmap->fp);
    free(Mmap);
    return(NULL);
    }

  return(Mmap);
} /* MmapFile() */

/**************************************
 MmapFree(): Free memory map from MmapFile.
 **************************************/
void	MmapFree	(mmapfile *Mmap)
{
  if (!Mmap) { return; }
  if (Mmap->mem) { munmap(Mmap->mem,Mmap->memsize); }
  fclose(Mmap->fp);
  free(Mmap);
} /* MmapFree() */
