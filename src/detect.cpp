/************************************************
 PDFgate: implemented in C
 See LICENSE

 Detectors and the top-level check.

 The check runs in a fixed order and stops at the first problem:
   1. Structure: is there a "%PDF-" header?
   2. Script: JavaScript markers and hex-obfuscated script.
   3. Forms: AcroForm/XFA and form fields.
   4. External references: remote actions and URLs.
   5. Embedded files: attachments and file specifications.
 Scripting is the most severe signal, so it wins whenever a
 document has more than one problem. Only one verdict is
 ever reported.

 Each detector sees the text it needs:
   Script   :: streams removed, whitespace collapsed
   Forms    :: raw
   External :: whitespace collapsed (streams kept)
   Embedded :: raw

 This is a heuristic gate, not a parser. It prefers false
 positives: any scripting vocabulary next to hex-encoded data
 is treated as a hidden script, even if the hex would decode
 to something harmless.
 ************************************************/
#include <stdlib.h>
#include <string.h>

#include "gate.hpp"
#include "verdict.hpp"
#include "signatures.hpp"
#include "normalize.hpp"
#include "detect.hpp"

/**************************************
 _SetReason(): Record which pattern matched.
 **************************************/
static void	_SetReason	(const char **Reason, const RE2 *Rx)
{
  if (Reason && Rx) { *Reason = Rx->pattern().c_str(); }
} /* _SetReason() */

/**************************************
 Gate_ValidateStructure(): Is this plausibly a PDF?
 The "%PDF-" header must be in the first 1024 bytes.
 Some producers prepend junk, so it does not need to be at offset 0.
 Returns: GATE_PASS or GATE_INVALID_STRUCTURE.
 **************************************/
gateverdict	Gate_ValidateStructure	(size_t DataLen, const byte *Data)
{
  size_t Limit,Pos;

  if (!Data || (DataLen == 0)) { return(GATE_INVALID_STRUCTURE); }

  Limit = Min(DataLen,(size_t)GATE_HEADER_WINDOW);
  for(Pos=0; Pos+5 <= Limit; Pos++)
    {
    if (!memcmp(Data+Pos,"%PDF-",5)) { return(GATE_PASS); }
    }
  return(GATE_INVALID_STRUCTURE);
} /* Gate_ValidateStructure() */

/**************************************
 _HexNearScript(): Look for '#' hex runs with script words just before them.
 E.g., "/S /JavaScript /JS (#6170702E616C657274...)"
 Only the 80 characters before each run are checked.
 Returns: true if found.
 **************************************/
static bool	_HexNearScript	(const gatesigs *Sigs, size_t TextLen, const byte *Text)
{
  size_t Pos,Start,End,From;

  if (!Sigs->HexRun || !Sigs->ScriptWord) { return(false); }

  for(Pos=0; Gate_SigsFind(Sigs->HexRun,TextLen,Text,Pos,&Start,&End); Pos=End)
    {
    From = (Start > GATE_HEX_CONTEXT) ? Start-GATE_HEX_CONTEXT : 0;
    if (Gate_SigsFind(Sigs->ScriptWord,Start-From,Text+From,0,NULL,NULL))
	{
	return(true);
	}
    if (End <= Start) { End = Start+1; } // never loop on an empty match
    }
  return(false);
} /* _HexNearScript() */

/**************************************
 Gate_DetectScript(): Look for JavaScript.
 Streams are removed first; everything else in this
 file scans the streams too.
 Returns: GATE_PASS or GATE_SCRIPT_DETECTED.
 **************************************/
gateverdict	Gate_DetectScript	(const gatesigs *Sigs, size_t TextLen, const byte *Text, const char **Reason)
{
  byte *Stripped, *Normal;
  size_t StrippedLen, NormalLen;
  gateverdict rc=GATE_PASS;
  int Hit;

  if (!Sigs) { return(GATE_PASS); }

  Stripped = Gate_StripStreams(TextLen,Text,&StrippedLen);
  Normal = Gate_CollapseSpace(StrippedLen,Stripped,&NormalLen);

  // Direct markers
  Hit = Gate_SigsMatch(&Sigs->Script,NormalLen,Normal);
  if (Hit >= 0)
    {
    _SetReason(Reason,Sigs->Script.Rx[Hit]);
    rc = GATE_SCRIPT_DETECTED;
    }

  // Hex escapes near a script marker
  else if (_HexNearScript(Sigs,StrippedLen,Stripped))
    {
    _SetReason(Reason,Sigs->HexRun);
    rc = GATE_SCRIPT_DETECTED;
    }

  // <hex> strings anywhere plus script words anywhere
  else if (Sigs->HexAngle && Sigs->ScriptWord &&
	   Gate_SigsFind(Sigs->HexAngle,StrippedLen,Stripped,0,NULL,NULL) &&
	   Gate_SigsFind(Sigs->ScriptWord,StrippedLen,Stripped,0,NULL,NULL))
    {
    _SetReason(Reason,Sigs->HexAngle);
    rc = GATE_SCRIPT_DETECTED;
    }

  free(Normal);
  free(Stripped);
  return(rc);
} /* Gate_DetectScript() */

/**************************************
 Gate_DetectForms(): Look for interactive forms.
 Returns: GATE_PASS or GATE_FORM_DETECTED.
 **************************************/
gateverdict	Gate_DetectForms	(const gatesigs *Sigs, size_t TextLen, const byte *Text, const char **Reason)
{
  int Hit;

  if (!Sigs) { return(GATE_PASS); }
  Hit = Gate_SigsMatch(&Sigs->Forms,TextLen,Text);
  if (Hit < 0) { return(GATE_PASS); }
  _SetReason(Reason,Sigs->Forms.Rx[Hit]);
  return(GATE_FORM_DETECTED);
} /* Gate_DetectForms() */

/**************************************
 Gate_DetectExternalRefs(): Look for external actions and URLs.
 Any http, https, ftp, or file URL counts. Telling a harmless
 hyperlink from an exfiltration target is the caller's policy.
 Returns: GATE_PASS or GATE_EXTERNAL_REF_DETECTED.
 **************************************/
gateverdict	Gate_DetectExternalRefs	(const gatesigs *Sigs, size_t TextLen, const byte *Text, const char **Reason)
{
  byte *Normal;
  size_t NormalLen;
  int Hit;

  if (!Sigs) { return(GATE_PASS); }

  Normal = Gate_CollapseSpace(TextLen,Text,&NormalLen);
  Hit = Gate_SigsMatch(&Sigs->External,NormalLen,Normal);
  free(Normal);

  if (Hit < 0) { return(GATE_PASS); }
  _SetReason(Reason,Sigs->External.Rx[Hit]);
  return(GATE_EXTERNAL_REF_DETECTED);
} /* Gate_DetectExternalRefs() */

/**************************************
 Gate_DetectEmbeddedFiles(): Look for attachments.
 Returns: GATE_PASS or GATE_EMBEDDED_FILE_DETECTED.
 **************************************/
gateverdict	Gate_DetectEmbeddedFiles	(const gatesigs *Sigs, size_t TextLen, const byte *Text, const char **Reason)
{
  int Hit;

  if (!Sigs) { return(GATE_PASS); }
  Hit = Gate_SigsMatch(&Sigs->Embedded,TextLen,Text);
  if (Hit < 0) { return(GATE_PASS); }
  _SetReason(Reason,Sigs->Embedded.Rx[Hit]);
  return(GATE_EMBEDDED_FILE_DETECTED);
} /* Gate_DetectEmbeddedFiles() */

/**************************************
 Gate_Check(): Run every check in order.
 If Sigs is NULL, the built-in signatures are used.
 Returns: the first non-pass verdict, or GATE_PASS.
 **************************************/
gateverdict	Gate_Check	(const gatesigs *Sigs, size_t DataLen, const byte *Data, const char **Reason)
{
  gateverdict rc;

  if (Reason) { *Reason = NULL; }
  if (!Sigs) { Sigs = Gate_SigsDefault(); }

  rc = Gate_ValidateStructure(DataLen,Data);
  if (rc != GATE_PASS) { return(rc); }

  rc = Gate_DetectScript(Sigs,DataLen,Data,Reason);
  if (rc != GATE_PASS) { return(rc); }

  rc = Gate_DetectForms(Sigs,DataLen,Data,Reason);
  if (rc != GATE_PASS) { return(rc); }

  rc = Gate_DetectExternalRefs(Sigs,DataLen,Data,Reason);
  if (rc != GATE_PASS) { return(rc); }

  return(Gate_DetectEmbeddedFiles(Sigs,DataLen,Data,Reason));
} /* Gate_Check() */

/**************************************
 Gate_CheckDefault(): Gate_Check() with the built-in signatures.
 **************************************/
gateverdict	Gate_CheckDefault	(size_t DataLen, const byte *Data)
{
  return(Gate_Check(Gate_SigsDefault(),DataLen,Data,NULL));
} /* Gate_CheckDefault() */
