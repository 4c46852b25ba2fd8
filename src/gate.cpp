/************************************************
 PDFgate: implemented in C
 See LICENSE

 The parameters store.

 Every setting (defaults, config file, command-line) and
 every per-input result (downloads, errors) is a named
 record in one chain. A record owns its name and value.
 Values always have PAD null bytes after them, so a text
 value is also a C string.

 New records go on the front of the chain, so setting a
 new field can change the head. Changing a field that
 already exists never does.
 ************************************************/
#include <stdlib.h>
#include <ctype.h>
#include <string.h>
#include <errno.h>
#include <limits.h>
#include "gate.hpp"

#define PAD 4 /* null padding after every value */

int Verbose=0;

/**************************************
 DEBUGhexdump(): Display hexdump of data.
 Strictly for debugging.
 **************************************/
void	DEBUGhexdump	(size_t DataLen, const byte *Data)
{
  size_t line,i;

  for(line=0; line < DataLen; line+=16)
    {
    fprintf(stderr,"%08x | ",(int)line);
    for(i=0; i < 16; i++)
      {
      if (i==8) { fprintf(stderr," "); }
      if (line+i < DataLen) { fprintf(stderr,"%02x ",Data[line+i]); }
      else { fprintf(stderr,"   "); }
      }
    fprintf(stderr,"| ");
    for(i=0; (i < 16) && (line+i < DataLen); i++)
      {
      fprintf(stderr,"%c",isprint(Data[line+i]) ? Data[line+i] : '.');
      }
    fprintf(stderr,"\n");
    }
} /* DEBUGhexdump() */

/**************************************
 _GateFreeRecord(): Release one record.
 **************************************/
static void	_GateFreeRecord	(gatefield *vf)
{
  free(vf->Field);
  free(vf->Value);
  free(vf);
} /* _GateFreeRecord() */

/**************************************
 _GateResize(): Change the size of a record's value.
 Any new space is zeroed.
 **************************************/
static void	_GateResize	(gatefield *vf, size_t ValueLen)
{
  byte *v;

  v = (byte*)realloc(vf->Value,ValueLen+PAD);
  if (!v)
    {
    fprintf(stderr,"ERROR: Cannot allocate %lu bytes for '%s'\n",(unsigned long)ValueLen,vf->Field);
    exit(1);
    }
  if (!vf->Value || (ValueLen > vf->ValueLen))
    {
    size_t Old = vf->Value ? vf->ValueLen : 0;
    memset(v+Old,0,ValueLen-Old+PAD);
    }
  else { memset(v+ValueLen,0,PAD); }
  vf->Value = v;
  vf->ValueLen = ValueLen;
} /* _GateResize() */

/**************************************
 _GateNewRecord(): Allocate an empty record.
 **************************************/
static gatefield *	_GateNewRecord	(const char *Field, char Type)
{
  gatefield *vf;

  vf = (gatefield*)calloc(sizeof(gatefield),1);
  if (vf) { vf->Field = strdup(Field); }
  if (!vf || !vf->Field)
    {
    fprintf(stderr,"ERROR: Cannot allocate parameter '%s'\n",Field);
    exit(1);
    }
  vf->FieldLen = strlen(Field);
  vf->Type = Type;
  _GateResize(vf,0);
  return(vf);
} /* _GateNewRecord() */

/**************************************
 _GateRecord(): Find a field, creating it if it is missing.
 The record takes on the new Type.
 Returns: the record. *vfhead changes if the record is new.
 **************************************/
static gatefield *	_GateRecord	(gatefield **vfhead, const char *Field, char Type)
{
  gatefield *vf;

  vf = GateSearch(*vfhead,Field);
  if (!vf)
    {
    vf = _GateNewRecord(Field,Type);
    vf->Next = *vfhead;
    *vfhead = vf;
    }
  vf->Type = Type;
  return(vf);
} /* _GateRecord() */

/**************************************
 GateFree(): Free the chain of gatefield records.
 Caller MUST not use vf anymore.
 **************************************/
void	GateFree	(gatefield *vf)
{
  gatefield *vfnext;

  for( ; vf; vf=vfnext)
    {
    vfnext = vf->Next;
    _GateFreeRecord(vf);
    }
} /* GateFree() */

/**************************************
 GateWalk(): DEBUGGING. Walk the chain of gatefield records.
 Binary values (e.g., downloads) only show the first 64 bytes.
 **************************************/
void	GateWalk	(gatefield *vf, bool ShowOne)
{
  int num;
  size_t i,Val;

  for(num=0; vf; vf=vf->Next, num++)
    {
    fprintf(stderr,"gatefield[%d]: '%s' (type %c, %lu bytes)",
	num, vf->Field, vf->Type, (unsigned long)vf->ValueLen);
    if (vf->Type=='c') { fprintf(stderr," = '%s'\n",(char*)vf->Value); }
    else if (vf->Type=='I')
	{
	fprintf(stderr," =");
	for(i=0; i+sizeof(size_t) <= vf->ValueLen; i+=sizeof(size_t))
	  {
	  memcpy(&Val,vf->Value+i,sizeof(size_t));
	  fprintf(stderr," %lu",(unsigned long)Val);
	  }
	fprintf(stderr,"\n");
	}
    else
	{
	fprintf(stderr,"\n");
	DEBUGhexdump(Min(vf->ValueLen,(size_t)64),vf->Value);
	}
    if (ShowOne) { break; }
    }
} /* GateWalk() */

/**************************************
 GateSearch(): Find a field in the chain of gatefield records.
 Returns: gatefield* on match, NULL if missed.
 **************************************/
gatefield *	GateSearch	(gatefield *vf, const char *Field)
{
  if (!Field) { return(NULL); }
  for( ; vf; vf=vf->Next)
    {
    if (!strcmp(vf->Field,Field)) { return(vf); }
    }
  return(NULL);
} /* GateSearch() */

/**************************************
 GateDel(): Delete a field (if it exists).
 Returns: New head.
 **************************************/
gatefield *	GateDel	(gatefield *vfhead, const char *Field)
{
  gatefield **pvf, *vf;

  if (!Field) { return(vfhead); }
  for(pvf=&vfhead; *pvf; )
    {
    vf = *pvf;
    if (!strcmp(vf->Field,Field))
	{
	*pvf = vf->Next;
	_GateFreeRecord(vf);
	}
    else { pvf = &vf->Next; }
    }
  return(vfhead);
} /* GateDel() */

/**************************************
 GateRename(): Give a field a new name.
 Any existing field with the new name is replaced.
 Nothing changes if the old field does not exist.
 Returns: New head.
 **************************************/
gatefield *	GateRename	(gatefield *vfhead, const char *From, const char *To)
{
  gatefield *vf;
  char *Name;

  if (!To) { return(vfhead); }
  vf = GateSearch(vfhead,From);
  if (!vf || !strcmp(From,To)) { return(vfhead); }

  vfhead = GateDel(vfhead,To); // vf is not To, so it survives
  Name = strdup(To);
  if (!Name)
    {
    fprintf(stderr,"ERROR: Cannot allocate parameter '%s'\n",To);
    exit(1);
    }
  free(vf->Field);
  vf->Field = Name;
  vf->FieldLen = strlen(Name);
  return(vfhead);
} /* GateRename() */

/**************************************
 GateClone(): Copy entire gatefield chain to a new chain.
 The order is preserved.
 Returns: head of new gatefield chain.
 **************************************/
gatefield *	GateClone	(gatefield *src)
{
  gatefield *dst=NULL, **tail=&dst, *d;

  for( ; src; src=src->Next)
    {
    d = _GateNewRecord(src->Field,src->Type);
    _GateResize(d,src->ValueLen);
    memcpy(d->Value,src->Value,src->ValueLen);
    *tail = d;
    tail = &d->Next;
    }
  return(dst);
} /* GateClone() */

/**************************************
 GateGetSize(): How many bytes are in a field's value?
 Returns: length of data (0=no data, same as not found)
 **************************************/
size_t	GateGetSize	(gatefield *vfhead, const char *Field)
{
  gatefield *vf;
  vf = GateSearch(vfhead,Field);
  return(vf ? vf->ValueLen : 0);
} /* GateGetSize() */

/**************************************
 GateGetBin(), GateGetText(): Get a field's value.
 Returns: pointer into the record, or NULL if missed.
 **************************************/
byte *	GateGetBin	(gatefield *vfhead, const char *Field)
{
  gatefield *vf;
  vf = GateSearch(vfhead,Field);
  return(vf ? vf->Value : NULL);
} /* GateGetBin() */

char *	GateGetText	(gatefield *vfhead, const char *Field)
{
  return((char*)GateGetBin(vfhead,Field));
} /* GateGetText() */

/**************************************
 GateSetBin(): Set a field to binary data.
 A NULL Value makes an empty field.
 Returns: head of gatefield chain.
 **************************************/
gatefield *	GateSetBin	(gatefield *vfhead, const char *Field, size_t ValueLen, const byte *Value)
{
  gatefield *vf;

  if (!Field) { return(vfhead); }
  if (!Value) { ValueLen=0; }
  vf = _GateRecord(&vfhead,Field,'b');
  _GateResize(vf,ValueLen);
  if (ValueLen) { memcpy(vf->Value,Value,ValueLen); }
  return(vfhead);
} /* GateSetBin() */

/**************************************
 GateAddBin(): Append binary data to a field.
 If the field does not exist, it is created.
 Returns: head of gatefield chain.
 **************************************/
gatefield *	GateAddBin	(gatefield *vfhead, const char *Field, size_t ValueLen, const byte *Value)
{
  gatefield *vf;
  size_t OldLen;

  if (!Field || !Value || !ValueLen) { return(vfhead); }
  vf = _GateRecord(&vfhead,Field,'b');
  OldLen = vf->ValueLen;
  _GateResize(vf,OldLen+ValueLen);
  memcpy(vf->Value+OldLen,Value,ValueLen);
  return(vfhead);
} /* GateAddBin() */

/**************************************
 GateSetText(): Set a field to a text string.
 Returns: head of gatefield chain.
 **************************************/
gatefield *	GateSetText	(gatefield *vfhead, const char *Field, const char *Value)
{
  vfhead = GateSetBin(vfhead,Field,Value ? strlen(Value) : 0,(const byte*)Value);
  if (Field) { GateSearch(vfhead,Field)->Type='c'; }
  return(vfhead);
} /* GateSetText() */

/**************************************
 GateAddText(): Append text to a field.
 Returns: head of gatefield chain.
 **************************************/
gatefield *	GateAddText	(gatefield *vfhead, const char *Field, const char *Value)
{
  if (!Field || !Value || !Value[0]) { return(vfhead); }
  vfhead = GateAddBin(vfhead,Field,strlen(Value),(const byte*)Value);
  GateSearch(vfhead,Field)->Type='c';
  return(vfhead);
} /* GateAddText() */

/**************************************
 GateSetIindex(): Set one entry in an array of size_t.
 The array grows as needed; unset entries are 0.
 Returns: head of gatefield chain.
 **************************************/
gatefield *	GateSetIindex	(gatefield *vfhead, const char *Field, int Index, size_t Value)
{
  gatefield *vf;
  size_t Need;

  if (!Field || (Index < 0)) { return(vfhead); }
  vf = _GateRecord(&vfhead,Field,'I');
  Need = (Index+1)*sizeof(size_t);
  if (vf->ValueLen < Need) { _GateResize(vf,Need); }
  memcpy(vf->Value+Index*sizeof(size_t),&Value,sizeof(size_t));
  return(vfhead);
} /* GateSetIindex() */

/**************************************
 GateGetIindex(): Get one entry in an array of size_t.
 Returns: the value, or 0 if the field or index is missing.
 **************************************/
size_t	GateGetIindex	(gatefield *vfhead, const char *Field, int Index)
{
  gatefield *vf;
  size_t v;

  vf = GateSearch(vfhead,Field);
  if (!vf || (Index < 0) || ((Index+1)*sizeof(size_t) > vf->ValueLen)) { return(0); }
  memcpy(&v,vf->Value+Index*sizeof(size_t),sizeof(size_t));
  return(v);
} /* GateGetIindex() */

/**************************************
 _GateIsNumber(): Is the text a non-negative decimal number?
 **************************************/
static bool	_GateIsNumber	(const char *Str)
{
  if (!Str || !Str[0]) { return(false); }
  for( ; Str[0]; Str++)
    {
    if (!isdigit(Str[0])) { return(false); }
    }
  return(true);
} /* _GateIsNumber() */

/**************************************
 GateParmCheck(): Check for sane input parameters.
 Aborts on any bad value.
 Converts numeric text fields into their "@" size_t forms:
   maxsize -> @maxsize (any size_t)
   timeout -> @timeout (seconds; must fit in a long for curl)
 Returns: head of gatefield chain.
 **************************************/
gatefield *	GateParmCheck	(gatefield *Args)
{
  gatefield *vf;
  const char *Str;
  unsigned int i;

  // Rename long parameters to short
  Args = GateRename(Args,"digestalg","da");

  // All user parameters: printable and no control characters
  for(vf=Args; vf; vf=vf->Next)
    {
    if ((vf->Type != 'c') || (vf->Field[0]=='@')) { continue; }
    for(i=0; i < vf->ValueLen; i++)
      {
      if (isalnum(vf->Value[i]) || ispunct(vf->Value[i]) || (vf->Value[i]==' ')) { continue; }
      fprintf(stderr," ERROR: Invalid parameter: '%s' value contains an invalid character.\n",vf->Field);
      exit(1);
      }
    }

  // Digest algorithm
  Str = GateGetText(Args,"da");
  if (Str && Str[0] &&
      strcmp(Str,"sha224") && strcmp(Str,"sha256") &&
      strcmp(Str,"sha384") && strcmp(Str,"sha512"))
    {
    fprintf(stderr," ERROR: Invalid parameter: 'digestalg' must be sha224, sha256, sha384, or sha512.\n");
    exit(1);
    }

  // Numeric values
  const char *Numeric[]={"maxsize","timeout",NULL};
  const unsigned long long NumericMax[]={SIZE_MAX,LONG_MAX};
  for(i=0; Numeric[i]; i++)
    {
    char Internal[32];
    unsigned long long Num;
    Str = GateGetText(Args,Numeric[i]);
    if (!Str) { continue; }
    if (!_GateIsNumber(Str))
      {
      fprintf(stderr," ERROR: Invalid parameter: '%s' must be a non-negative number.\n",Numeric[i]);
      exit(1);
      }
    errno=0;
    Num = strtoull(Str,NULL,10);
    if ((errno == ERANGE) || (Num > NumericMax[i]))
      {
      fprintf(stderr," ERROR: Invalid parameter: '%s' is too large (maximum %llu).\n",Numeric[i],NumericMax[i]);
      exit(1);
      }
    snprintf(Internal,sizeof(Internal),"@%s",Numeric[i]);
    Args = GateSetIindex(Args,Internal,0,(size_t)Num);
    }

  // Flags
  Str = GateGetText(Args,"insecure");
  if (Str && strcmp(Str,"0") && strcmp(Str,"1"))
    {
    fprintf(stderr," ERROR: Invalid parameter: 'insecure' must be 0 or 1.\n");
    exit(1);
    }

  return(Args);
} /* GateParmCheck() */
