/************************************************
 PDFgate: Code to handle curl requests.
 See LICENSE

 curl is used to download documents given as URLs
 instead of filenames.

 curl has two modes:
   Easy is synchronous and blocking.
   The other is multithreaded and non-blocking.
 For this code, use easy!
 ************************************************/

#include <curl/curl.h>
#include <string.h> // memset
#include <strings.h> // strncasecmp
#include <limits.h> // LONG_MAX
#include "gate.hpp"
#include "fetch.hpp"

/********************************************************
 GateIsURL(): Is this a URL (true) or a filename (false)?
 ********************************************************/
bool	GateIsURL	(const char *Str)
{
  if (!Str) { return(false); }
  if (!strncasecmp(Str,"http://",7)) { return(true); }
  if (!strncasecmp(Str,"https://",8)) { return(true); }
  if (!strncasecmp(Str,"ftp://",6)) { return(true); }
  if (!strncasecmp(Str,"file://",7)) { return(true); }
  return(false);
} /* GateIsURL() */

/********************************************************
 GateCurlCallback(): Receive data from curl!
 Stops the transfer (returns 0) if the download grows
 beyond @maxsize.
 ********************************************************/
static size_t	GateCurlCallback	(void *buffer, size_t size, size_t nmemb, void *parm)
{
  gatefield *Args;
  size_t MaxSize;

  Args = (gatefield *)parm;
  MaxSize = GateGetIindex(Args,"@maxsize",0);
  if (MaxSize && (GateGetSize(Args,"@download") + nmemb*size > MaxSize))
    {
    GateSetIindex(Args,"@toolarge",0,1); // field exists, so the head does not move
    return(0);
    }

  // "@download" already exists, so the head does not move
  GateAddBin(Args,"@download",nmemb*size,(byte*)buffer);
  return(nmemb*size);
} /* GateCurlCallback() */

/********************************************************
 GateFetchURL(): Download a URL into memory.
 Uses "@maxsize", "@timeout", "cacert", and "insecure".
 Returns: Args.
   On success, "@download" holds the document.
   On failure, "@download" is removed and "@error" says why.
 ********************************************************/
gatefield *	GateFetchURL	(gatefield *Args, const char *URL)
{
  CURL *ch; // curl handle
  CURLcode crc; // curl return code
  char errbuf[CURL_ERROR_SIZE];
  char *Str;
  size_t Timeout;

  // Clear any previous results
  Args = GateDel(Args,"@error");
  Args = GateDel(Args,"@download");

  if (!GateIsURL(URL))
    {
    Args = GateSetText(Args,"@error","Not a supported URL (http, https, ftp, file)");
    return(Args);
    }

  // Prepare curl
  crc = curl_global_init(CURL_GLOBAL_DEFAULT);
  if (crc != CURLE_OK)
    {
    fprintf(stderr,"ERROR: Failed to initialize curl. Aborting.\n");
    exit(1);
    }

  ch = curl_easy_init();
  if (!ch)
    {
    fprintf(stderr,"ERROR: Failed to initialize curl handle. Aborting.\n");
    exit(1);
    }

  /*****
   Pre-allocate the results and the overflow flag.
   The callback only appends to existing fields, so the
   head of Args never changes during the transfer.
   *****/
  Args = GateSetBin(Args,"@download",0,NULL);
  Args = GateSetIindex(Args,"@toolarge",0,0);

  // Set retrieval parameters
  curl_easy_setopt(ch, CURLOPT_URL, URL);
  curl_easy_setopt(ch, CURLOPT_WRITEFUNCTION, GateCurlCallback);
  curl_easy_setopt(ch, CURLOPT_WRITEDATA, (void*)Args);
  memset(errbuf,0,CURL_ERROR_SIZE);
  curl_easy_setopt(ch, CURLOPT_ERRORBUFFER, errbuf);
  curl_easy_setopt(ch, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(ch, CURLOPT_MAXREDIRS, 5L);
  curl_easy_setopt(ch, CURLOPT_FAILONERROR, 1L); // HTTP errors are failures, not documents
  curl_easy_setopt(ch, CURLOPT_CONNECTTIMEOUT, 20L); // 20 seconds to connect
  Timeout = GateGetIindex(Args,"@timeout",0);
  if (Timeout > (size_t)LONG_MAX) { Timeout = LONG_MAX; }
  if (Timeout) { curl_easy_setopt(ch, CURLOPT_TIMEOUT, (long)Timeout); }
  if (Verbose > 2) { curl_easy_setopt(ch, CURLOPT_VERBOSE, 1L); }

  Str = GateGetText(Args,"cacert");
  if (Str && Str[0]) { curl_easy_setopt(ch, CURLOPT_CAINFO, Str); }

  Str = GateGetText(Args,"insecure");
  if (Str && !strcmp(Str,"1"))
    {
    curl_easy_setopt(ch, CURLOPT_SSL_VERIFYPEER, 0L);
    curl_easy_setopt(ch, CURLOPT_SSL_VERIFYHOST, 0L);
    }

  // Do the request!
  crc = curl_easy_perform(ch);
  curl_easy_cleanup(ch);

  // Clean up
  curl_global_cleanup();

  if (GateGetIindex(Args,"@toolarge",0))
    {
    Args = GateDel(Args,"@download");
    Args = GateSetText(Args,"@error","Download exceeds maxsize");
    }
  else if (crc != CURLE_OK)
    {
    char Msg[CURL_ERROR_SIZE+64];
    snprintf(Msg,sizeof(Msg),"curl(%d): %s",(int)crc,errbuf[0] ? errbuf : curl_easy_strerror(crc));
    Args = GateDel(Args,"@download");
    Args = GateSetText(Args,"@error",Msg);
    }
  Args = GateDel(Args,"@toolarge");

  if (Verbose > 1) { DEBUGPRINT("Fetched %lu bytes from %s",(unsigned long)GateGetSize(Args,"@download"),URL); }
  return(Args);
} /* GateFetchURL() */
