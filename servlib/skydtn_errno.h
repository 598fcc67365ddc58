/*
 *    Copyright 2015 United States Government as represented by NASA
 *       Marshall Space Flight Center. All Rights Reserved.
 *
 *    Released under the NASA Open Source Software Agreement version 1.3;
 *    You may obtain a copy of the Agreement at:
 * 
 *        http://ti.arc.nasa.gov/opensource/nosa/
 * 
 *    The subject software is provided "AS IS" WITHOUT ANY WARRANTY of any kind,
 *    either expressed, implied or statutory and this agreement does not,
 *    in any manner, constitute an endorsement by government agency of any
 *    results, designs or products resulting from use of the subject software.
 *    See the Agreement for the specific language governing permissions and
 *    limitations.
 */

#ifndef _SKYDTN_ERRNO_H_
#define _SKYDTN_ERRNO_H_

/**
 * Status codes returned by the store, router and node operations.
 */
#define SKYDTN_SUCCESS      0                   /* ok */
#define SKYDTN_ERRBASE      128                 /* Base error code */
#define SKYDTN_EVALIDATION  (SKYDTN_ERRBASE+1)  /* malformed, expired or over hop limit */
#define SKYDTN_ENOTFOUND    (SKYDTN_ERRBASE+2)  /* no bundle with that id */
#define SKYDTN_ECAPACITY    (SKYDTN_ERRBASE+3)  /* queue or store full */
#define SKYDTN_ENOROUTE     (SKYDTN_ERRBASE+4)  /* no active eligible neighbor */
#define SKYDTN_ESTATE       (SKYDTN_ERRBASE+5)  /* illegal in current node state */
#define SKYDTN_EINTERNAL    (SKYDTN_ERRBASE+6)  /* misc. internal error */
#define SKYDTN_ERRMAX       255

namespace skydtn {

/**
 * Get a string value associated with the error code.
 */
const char* skydtn_strerror(int err);

} // namespace skydtn

#endif /* _SKYDTN_ERRNO_H_ */
