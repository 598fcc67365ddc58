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

#ifdef HAVE_CONFIG_H
#  include <skydtn-config.h>
#endif

#include <string.h>

#include "StorageCommand.h"
#include "storage/BundleStorageConfig.h"

namespace skydtn {

StorageCommand::StorageCommand(BundleStorageConfig* cfg)
    : TclCommand(cfg->cmd_.c_str()),
      config_(cfg)
{
    bind_var(new oasys::StringOpt("type", &cfg->type_, "type",
                                  "Bundle store backend: memory (no "
                                  "persistence), memorydb, filesysdb or "
                                  "berkeleydb (default memory)"));

    bind_var(new oasys::StringOpt("dbname", &cfg->dbname_, "name",
                                  "Name of the durable store (default skydtn)"));

    bind_var(new oasys::StringOpt("dbdir", &cfg->dbdir_, "dir",
                                  "Directory holding the durable store "
                                  "(default /var/skydtn/db)"));

    bind_var(new oasys::UIntOpt("max_bundles", &cfg->max_bundles_, "count",
                                "Bundles held before the store evicts or "
                                "refuses, 0 for no bound (default 10000)"));

    bind_var(new oasys::BoolOpt("init_db", &cfg->init_,
                                "Create the store tables when the node "
                                "starts, like skydtnd --init-db"));

    bind_var(new oasys::BoolOpt("tidy", &cfg->tidy_,
                                "Drop all stored bundles when the node "
                                "starts, like skydtnd --tidy"));

    bind_var(new oasys::IntOpt("tidy_wait", &cfg->tidy_wait_, "secs",
                               "Grace period before a tidy wipes the store"));

    bind_var(new oasys::BoolOpt("leave_clean_file", &cfg->leave_clean_file_,
                                "Mark a clean shutdown with a .ds_clean file"));

    bind_var(new oasys::BoolOpt("db_txn", &cfg->db_txn_,
                                "Wrap berkeleydb updates in transactions"));

    add_to_help("config", "dump the current storage configuration");
}

int
StorageCommand::exec(int argc, const char** argv, Tcl_Interp* interp)
{
    (void)interp;

    if (argc < 2) {
        resultf("need a storage subcommand");
        return TCL_ERROR;
    }

    const char* cmd = argv[1];

    if (strcmp(cmd, "config") == 0) {
        if (argc != 2) {
            wrong_num_args(argc, argv, 2, 2, 2);
            return TCL_ERROR;
        }

        resultf("type %s dbname %s dbdir %s max_bundles %u init_db %s tidy %s",
                config_->type_.c_str(), config_->dbname_.c_str(),
                config_->dbdir_.c_str(), config_->max_bundles_,
                config_->init_ ? "true" : "false",
                config_->tidy_ ? "true" : "false");
        return TCL_OK;
    }

    resultf("unknown storage subcommand %s", cmd);
    return TCL_ERROR;
}

} // namespace skydtn
