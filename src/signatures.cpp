/************************************************
 PDFgate: implemented in C
 See LICENSE

 Signature patterns.

 PDF names are written with a leading slash: /JavaScript, /AcroForm.
 The syntax permits whitespace between the slash and the name
 (and between /FT and its value), and readers accept any case.
 So every name pattern allows "\s*" and every pattern is compiled
 case-insensitive.

 Matching uses RE2: time is linear in the document size.
 Text is treated as Latin-1 so every byte is one character;
 PDF content is binary and rarely valid UTF-8.
 ************************************************/
#include <stdlib.h>
#include <stdio.h>
#include <string.h>
#include <re2/re2.h>

#include "gate.hpp"
#include "signatures.hpp"

/*****
 Scripting markers, in priority order.
 Includes JavaScript API calls that appear in the script body.
 *****/
static const char *ScriptPatterns[]=
  {
  "/\\s*JavaScript",
  "/\\s*JS",
  "/\\s*OpenAction",
  "app\\s*\\.",
  "eval\\s*\\(",
  "document\\s*\\.",
  "this\\s*\\.",
  "getField\\s*\\(",
  "submitForm\\s*\\(",
  "importDataObject\\s*\\(",
  "JS\\(\\s*#(?:[0-9A-Fa-f]{2,})+", // hex-escaped script inside JS()
  NULL
  };

static const char *FormPatterns[]=
  {
  "/\\s*AcroForm",
  "/\\s*XFA",
  "/\\s*Widget",
  "/\\s*FT\\s*/\\s*Tx",  // text field
  "/\\s*FT\\s*/\\s*Ch",  // choice field
  "/\\s*FT\\s*/\\s*Btn", // button field
  "/\\s*FT\\s*/\\s*Sig", // signature field
  NULL
  };

static const char *ExternalPatterns[]=
  {
  "/\\s*GoToR",
  "/\\s*Launch",
  "/\\s*ImportData",
  "/\\s*SubmitForm",
  "/\\s*URI\\b",
  "URI\\s*\\(",
  "\\bhttps?://",
  "\\bfile://",
  "\\bftp://",
  NULL
  };

static const char *EmbeddedPatterns[]=
  {
  "/\\s*EmbeddedFile",
  "/\\s*FileAttachment",
  "/\\s*Filespec",
  NULL
  };

const gatesigsrc GateDefaultPatterns =
  {
  ScriptPatterns,
  FormPatterns,
  ExternalPatterns,
  EmbeddedPatterns,
  "#(?:[0-9A-Fa-f]{2}){4,}",
  "<[0-9A-Fa-f]{4,}>",
  "javascript|js"
  };

/**************************************
 _SigCompile(): Compile one pattern.
 Returns: RE2* or NULL if the pattern is invalid.
 **************************************/
static RE2 *	_SigCompile	(const char *Pattern)
{
  RE2 *Rx;

  if (!Pattern) { return(NULL); }

  RE2::Options Opt;
  Opt.set_encoding(RE2::Options::EncodingLatin1);
  Opt.set_case_sensitive(false);
  Opt.set_log_errors(false);

  Rx = new RE2(Pattern,Opt);
  if (!Rx->ok())
    {
    fprintf(stderr,"ERROR: Invalid signature pattern '%s': %s\n",Pattern,Rx->error().c_str());
    delete Rx;
    return(NULL);
    }
  return(Rx);
} /* _SigCompile() */

/**************************************
 _SigListCompile(): Compile a NULL-terminated list.
 A missing list is an empty list.
 Returns: true on success, false if any pattern is invalid.
 **************************************/
static bool	_SigListCompile	(gatesiglist *List, const char **Patterns)
{
  size_t i,n;

  List->Count=0;
  List->Rx=NULL;
  if (!Patterns) { return(true); }

  for(n=0; Patterns[n]; n++) { ; }
  if (n==0) { return(true); }

  List->Rx = (RE2**)calloc(n,sizeof(RE2*));
  if (!List->Rx)
    {
    fprintf(stderr,"ERROR: Cannot allocate signature list\n");
    exit(1);
    }

  for(i=0; i < n; i++)
    {
    List->Rx[i] = _SigCompile(Patterns[i]);
    if (!List->Rx[i]) { return(false); }
    List->Count++;
    }
  return(true);
} /* _SigListCompile() */

/**************************************
 _SigListFree(): Release a compiled list.
 **************************************/
static void	_SigListFree	(gatesiglist *List)
{
  size_t i;
  if (!List->Rx) { return; }
  for(i=0; i < List->Count; i++) { delete List->Rx[i]; }
  free(List->Rx);
  List->Rx=NULL;
  List->Count=0;
} /* _SigListFree() */

/**************************************
 Gate_SigsFree(): Release a signature set.
 **************************************/
void	Gate_SigsFree	(gatesigs *Sigs)
{
  if (!Sigs) { return; }
  _SigListFree(&Sigs->Script);
  _SigListFree(&Sigs->Forms);
  _SigListFree(&Sigs->External);
  _SigListFree(&Sigs->Embedded);
  delete Sigs->HexRun;
  delete Sigs->HexAngle;
  delete Sigs->ScriptWord;
  free(Sigs);
} /* Gate_SigsFree() */

/**************************************
 Gate_SigsCompile(): Build a signature set from pattern text.
 Missing lists are empty. A missing hex pattern disables
 the heuristic that needs it.
 Caller must Gate_SigsFree() the result.
 Returns: gatesigs* or NULL if any pattern is invalid.
 **************************************/
gatesigs *	Gate_SigsCompile	(const gatesigsrc *Src)
{
  gatesigs *Sigs;
  bool ok=true;

  if (!Src) { return(NULL); }

  Sigs = (gatesigs*)calloc(sizeof(gatesigs),1);
  if (!Sigs)
    {
    fprintf(stderr,"ERROR: Cannot allocate signature set\n");
    exit(1);
    }

  ok = ok && _SigListCompile(&Sigs->Script,Src->Script);
  ok = ok && _SigListCompile(&Sigs->Forms,Src->Forms);
  ok = ok && _SigListCompile(&Sigs->External,Src->External);
  ok = ok && _SigListCompile(&Sigs->Embedded,Src->Embedded);
  if (ok && Src->HexRun)
    {
    Sigs->HexRun = _SigCompile(Src->HexRun);
    ok = (Sigs->HexRun != NULL);
    }
  if (ok && Src->HexAngle)
    {
    Sigs->HexAngle = _SigCompile(Src->HexAngle);
    ok = (Sigs->HexAngle != NULL);
    }
  if (ok && Src->ScriptWord)
    {
    Sigs->ScriptWord = _SigCompile(Src->ScriptWord);
    ok = (Sigs->ScriptWord != NULL);
    }

  if (!ok)
    {
    Gate_SigsFree(Sigs);
    return(NULL);
    }
  return(Sigs);
} /* Gate_SigsCompile() */

/**************************************
 Gate_SigsDefault(): The built-in signature set.
 Compiled on first use and kept for the life of the process.
 Returns: const gatesigs*; never NULL.
 **************************************/
const gatesigs *	Gate_SigsDefault	()
{
  static const gatesigs *Sigs = Gate_SigsCompile(&GateDefaultPatterns);
  if (!Sigs) // should never happen; the defaults are fixed
    {
    fprintf(stderr,"ERROR: Built-in signatures failed to compile. Aborting.\n");
    exit(1);
    }
  return(Sigs);
} /* Gate_SigsDefault() */

/**************************************
 Gate_SigsMatch(): Does any pattern in the list match the text?
 Patterns are tested in list order and the first hit stops the scan.
 Returns: index of the first matching pattern, or -1 if none match.
 **************************************/
int	Gate_SigsMatch	(const gatesiglist *List, size_t TextLen, const byte *Text)
{
  size_t i;

  if (!List) { return(-1); }
  re2::StringPiece Str((const char*)Text,Text ? TextLen : 0);
  for(i=0; i < List->Count; i++)
    {
    if (RE2::PartialMatch(Str,*List->Rx[i])) { return((int)i); }
    }
  return(-1);
} /* Gate_SigsMatch() */

/**************************************
 Gate_SigsFind(): Find the next match at or after StartPos.
 The text before StartPos is still used as context (e.g., for \b).
 Sets MatchStart and MatchEnd (end is one past the match).
 Returns: true if found, false if not.
 **************************************/
bool	Gate_SigsFind	(const RE2 *Rx, size_t TextLen, const byte *Text,
			 size_t StartPos, size_t *MatchStart, size_t *MatchEnd)
{
  if (!Rx || !Text || (StartPos > TextLen)) { return(false); }

  re2::StringPiece Str((const char*)Text,TextLen);
  re2::StringPiece Match;
  if (!Rx->Match(Str,StartPos,TextLen,RE2::UNANCHORED,&Match,1)) { return(false); }

  if (MatchStart) { *MatchStart = Match.data() - Str.data(); }
  if (MatchEnd) { *MatchEnd = (Match.data() - Str.data()) + Match.size(); }
  return(true);
} /* Gate_SigsFind() */
