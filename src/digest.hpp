/************************************************
 PDFgate: implemented in C
 See LICENSE

 Computing digests for identifying inspected files.
 ************************************************/
#ifndef DIGEST_HPP
#define DIGEST_HPP

#include <stdlib.h>
#include <openssl/evp.h>

#include "gate.hpp"

const EVP_MD* (*GateGetMdfFromString(const char *da))(void);
char *	GateDigestHex	(const char *da, size_t DataLen, const byte *Data);

#endif
