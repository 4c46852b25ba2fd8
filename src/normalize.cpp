/************************************************
 PDFgate: implemented in C
 See LICENSE

 Text normalization.

 Streams hold the binary payloads: images, fonts, compressed
 page content, compressed object streams.
   "stream"
   [binary data..]
   "endstream"
 Binary data can contain any byte sequence, so it can look like
 a signature (false positive) or hide one from a naive scan.
 Rather than decode every filter, the script scan skips streams.
 Stream stripping only keys on the keywords; it does not
 use the dictionary's /Length.

 Whitespace folding turns "/ \r\n JavaScript" into "/ JavaScript"
 so a token split across lines still matches.

 Both functions are single-pass over the input.
 ************************************************/
#include <stdlib.h>
#include <stdio.h>
#include <string.h>
#include <strings.h> // strncasecmp

#include "gate.hpp"
#include "normalize.hpp"

/**************************************
 Gate_isSpace(): Is this a whitespace character?
 Space, tab, LF, CR, and FF. (Not vertical tab.)
 Unlike isspace(), this does not depend on the locale.
 **************************************/
bool	Gate_isSpace	(byte c)
{
  return((c==' ') || (c=='\t') || (c=='\n') || (c=='\r') || (c=='\f'));
} /* Gate_isSpace() */

/**************************************
 _isWordChar(): [0-9A-Za-z_]
 **************************************/
static bool	_isWordChar	(byte c)
{
  return( ((c >= '0') && (c <= '9')) ||
	  ((c >= 'A') && (c <= 'Z')) ||
	  ((c >= 'a') && (c <= 'z')) ||
	  (c=='_') );
} /* _isWordChar() */

/**************************************
 _FindKeyword(): Find a case-insensitive keyword starting at Pos.
 Returns: offset of keyword, or TextLen if not found.
 **************************************/
static size_t	_FindKeyword	(size_t TextLen, const byte *Text, size_t Pos, const char *Keyword)
{
  size_t KeyLen;

  KeyLen = strlen(Keyword);
  if (TextLen < KeyLen) { return(TextLen); }
  for( ; Pos+KeyLen <= TextLen; Pos++)
    {
    if (!strncasecmp((const char*)Text+Pos,Keyword,KeyLen)) { return(Pos); }
    }
  return(TextLen);
} /* _FindKeyword() */

/**************************************
 _Alloc(): Allocate an output buffer.
 Normalized text is never longer than the input.
 **************************************/
static byte *	_Alloc	(size_t TextLen)
{
  byte *Out;
  Out = (byte*)calloc(TextLen+1,1); // +1 so empty input still allocates
  if (!Out)
    {
    fprintf(stderr,"ERROR: Cannot allocate %lu bytes for normalized text\n",(unsigned long)TextLen);
    exit(1);
    }
  return(Out);
} /* _Alloc() */

/**************************************
 Gate_StripStreams(): Replace stream bodies with a single space.
 A region starts at "stream" (any case) that is followed by a
 non-word character (or the end of the text) and ends after the
 nearest following "endstream" (any case).
 The start does not need to be on a word boundary.
 A "stream" without any later "endstream" is left alone.
 Caller must free() the result.
 Returns: allocated text and sets OutLen.
 **************************************/
byte *	Gate_StripStreams	(size_t TextLen, const byte *Text, size_t *OutLen)
{
  byte *Out;
  size_t Pos,Start,End,o;

  Out = _Alloc(TextLen);
  o=0;
  Pos=0;
  while(Pos < TextLen)
    {
    // Find the next "stream" keyword
    Start = _FindKeyword(TextLen,Text,Pos,"stream");
    if (Start >= TextLen) { break; }
    if ((Start+6 < TextLen) && _isWordChar(Text[Start+6]))
	{
	// Not a keyword; e.g., "streams". Keep it.
	memcpy(Out+o,Text+Pos,Start+1-Pos);
	o += Start+1-Pos;
	Pos = Start+1;
	continue;
	}

    // Find the closing "endstream"
    End = _FindKeyword(TextLen,Text,Start+6,"endstream");
    if (End >= TextLen)
	{
	// No terminator after this one means none after any later one.
	break;
	}

    // Keep everything before the stream, then one space for the stream
    memcpy(Out+o,Text+Pos,Start-Pos);
    o += Start-Pos;
    Out[o++] = ' ';
    Pos = End+9;
    }

  // Copy the remainder
  if (Pos < TextLen)
    {
    memcpy(Out+o,Text+Pos,TextLen-Pos);
    o += TextLen-Pos;
    }

  if (OutLen) { *OutLen = o; }
  return(Out);
} /* Gate_StripStreams() */

/**************************************
 Gate_CollapseSpace(): Replace every run of whitespace with one space.
 A single newline also becomes a space.
 Caller must free() the result.
 Returns: allocated text and sets OutLen.
 **************************************/
byte *	Gate_CollapseSpace	(size_t TextLen, const byte *Text, size_t *OutLen)
{
  byte *Out;
  size_t i,o;
  bool InSpace=false;

  Out = _Alloc(TextLen);
  for(i=o=0; i < TextLen; i++)
    {
    if (Gate_isSpace(Text[i]))
	{
	if (!InSpace) { Out[o++] = ' '; }
	InSpace=true;
	}
    else
	{
	Out[o++] = Text[i];
	InSpace=false;
	}
    }

  if (OutLen) { *OutLen = o; }
  return(Out);
} /* Gate_CollapseSpace() */
