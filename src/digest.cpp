/************************************************
 PDFgate: implemented in C
 See LICENSE

 Compute digests!
 The digest is reported next to every verdict so a rejected
 file can be found again (or blocked by hash) later.
 ************************************************/
// C headers
#include <stdlib.h>
#include <stdio.h>
#include <string.h>

#include "gate.hpp"
#include "digest.hpp"

// For openssl 3.x
#include <openssl/evp.h>

/**************************************
 GateGetMdfFromString(): Given a digest algorithm name, get the EVP_MD function.
 Defaults to sha256 when not specified
 Returns NULL on unsupported algorithm.
 **************************************/
const EVP_MD* (*GateGetMdfFromString(const char *da))(void)
{
  if (!da || !da[0] || !strcmp(da,"sha256")) { return EVP_sha256; } // default
  if (!strcmp(da,"sha224")) { return EVP_sha224; }
  if (!strcmp(da,"sha384")) { return EVP_sha384; }
  if (!strcmp(da,"sha512")) { return EVP_sha512; }
  return NULL;
} /* GateGetMdfFromString() */

/**************************************
 GateDigestHex(): Hash the data and return lowercase hex.
 Caller must free() the string.
 Returns: allocated string, or NULL on unknown algorithm or failure.
 **************************************/
char *	GateDigestHex	(const char *da, size_t DataLen, const byte *Data)
{
  const EVP_MD* (*mdf)(void);
  byte Digest[EVP_MAX_MD_SIZE];
  unsigned int DigestLen=0;
  char *Hex;
  unsigned int i;
  int n; // nibble

  mdf = GateGetMdfFromString(da);
  if (!mdf) { return(NULL); }

  EVP_MD_CTX* ctx = EVP_MD_CTX_new();
  if (!ctx) { return(NULL); }
  if ((EVP_DigestInit_ex(ctx, mdf(), NULL) != 1) ||
      (DataLen && (EVP_DigestUpdate(ctx, Data, DataLen) != 1)) ||
      (EVP_DigestFinal_ex(ctx, Digest, &DigestLen) != 1))
    {
    EVP_MD_CTX_free(ctx);
    return(NULL);
    }
  EVP_MD_CTX_free(ctx);

  Hex = (char*)calloc(DigestLen*2+4,1); // allocate extra for null padding
  if (!Hex) { return(NULL); }
  for(i=0; i < DigestLen; i++)
    {
    n=(Digest[i] / 0x10);
    if (n < 10) { Hex[i*2+0] = '0'+n; }
    else { Hex[i*2+0] = 'a'+(n-10); }
    n=(Digest[i] % 0x10);
    if (n < 10) { Hex[i*2+1] = '0'+n; }
    else { Hex[i*2+1] = 'a'+(n-10); }
    }
  return(Hex);
} /* GateDigestHex() */
