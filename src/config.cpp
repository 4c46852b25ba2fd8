/************************************************
 PDFgate: implemented in C
 See LICENSE

 Configuration file handling.
 The file uses the same field names as the long options:
   digestalg=sha512
   maxsize=10485760
 ************************************************/
// C headers
#include <stdlib.h>
#include <stdio.h>
#include <unistd.h>
#include <ctype.h> // isalnum, isspace
#include <string.h> // strdup

#include "gate.hpp"
#include "config.hpp"

/**************************************
 GateDefaultCfg(): Set the default config file: $HOME/.pdfgate.cfg
 Without a home directory there is no default file.
 **************************************/
gatefield *	GateDefaultCfg	(gatefield *Args)
{
  const char *Home;

  Home = getenv("HOME");
  if (!Home || !Home[0])
    {
    Args = GateSetText(Args,"config","");
    return(Args);
    }
  Args = GateSetText(Args,"config",Home);
  Args = GateAddText(Args,"config","/.pdfgate.cfg");
  return(Args);
} /* GateDefaultCfg() */

/**************************************
 GateReadCfg(): Read the config file named by "config".
 One "field = value" per line. Lines starting with '#' are comments.
 Only fields that already exist (have defaults) can be set.
 A missing file is fine; a malformed file is fatal.
 **************************************/
gatefield *	GateReadCfg	(gatefield *Args)
{
  char *Fname;
  FILE *fp;
  char Line[1024]; // no more than 1K per line
  char *Field,*End,*Value;
  size_t Len;
  int LineNo=0;

  // Copy the name; setting "config" from the file would move it
  Fname = GateGetText(Args,"config");
  if (!Fname || !Fname[0] || (access(Fname,F_OK) != 0)) { return(Args); }
  Fname = strdup(Fname);
  if (!Fname)
    {
    fprintf(stderr,"ERROR: Cannot allocate configuration file name\n");
    exit(1);
    }

  fp = fopen(Fname,"r");
  if (!fp)
    {
    fprintf(stderr,"ERROR: Unable to read configuration file: '%s'\n",Fname);
    exit(1);
    }

  while(fgets(Line,sizeof(Line),fp))
    {
    LineNo++;
    Len = strlen(Line);
    if ((Len+1 == sizeof(Line)) && (Line[Len-1] != '\n') && !feof(fp))
	{
	fprintf(stderr,"ERROR: configuration file line too long: line %d in '%s'\n",LineNo,Fname);
	exit(1);
	}

    // Trim both ends (includes DOS newlines)
    while((Len > 0) && isspace((byte)Line[Len-1])) { Line[--Len]='\0'; }
    for(Field=Line; isspace((byte)Field[0]); Field++) { ; }
    if (!Field[0] || (Field[0]=='#')) { continue; } // blank or comment

    // Field name is alphanumeric
    for(End=Field; isalnum((byte)End[0]); End++) { ; }
    if (End==Field)
	{
	fprintf(stderr,"ERROR: configuration file bad initial character: line %d in '%s'\n",LineNo,Fname);
	exit(1);
	}
    for(Value=End; isspace((byte)Value[0]); Value++) { ; }
    if (Value[0] != '=')
	{
	fprintf(stderr,"ERROR: configuration file missing '=': line %d in '%s'\n",LineNo,Fname);
	exit(1);
	}
    Value++;
    End[0]='\0';
    while(isspace((byte)Value[0])) { Value++; }
    if (!Value[0])
	{
	fprintf(stderr,"ERROR: configuration file missing value: line %d in '%s'\n",LineNo,Fname);
	exit(1);
	}

    if (!GateSearch(Args,Field))
	{
	fprintf(stderr,"ERROR: unknown field '%s': line %d in '%s'\n",Field,LineNo,Fname);
	exit(1);
	}
    if (Verbose > 2) { DEBUGPRINT("Config[%d] %s='%s'",LineNo,Field,Value); }
    Args = GateSetText(Args,Field,Value);
    }

  fclose(fp);
  free(Fname);
  return(Args);
} /* GateReadCfg() */

/**************************************
 GateWriteCfg(): Write the current options as a config file.
 The output can be read back with GateReadCfg().
 **************************************/
void	GateWriteCfg	(FILE *fp, gatefield *Args)
{
  const char *s;

  fprintf(fp,"# Checking options\n");
  fprintf(fp,"digestalg=%s\n",GateGetText(Args,"digestalg"));
  fprintf(fp,"maxsize=%s\n",GateGetText(Args,"maxsize"));
  fprintf(fp,"\n");
  fprintf(fp,"# URL options\n");
  fprintf(fp,"timeout=%s\n",GateGetText(Args,"timeout"));
  s=GateGetText(Args,"cacert");
  if (s && s[0]) { fprintf(fp,"cacert=%s\n",s); }
  else { fprintf(fp,"#cacert=\n"); }
  fprintf(fp,"insecure=%s\n",GateGetText(Args,"insecure"));
  fprintf(fp,"\n");
} /* GateWriteCfg() */
