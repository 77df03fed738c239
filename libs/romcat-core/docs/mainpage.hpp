/**
@file
@brief Main page documentation.
*/

/**
@mainpage romcat

romcat identifies game dumps against reference databases, detects dumps that only differ from a good dump by missing
padding, and maintains a multi-source catalog of platforms, works, releases and media.



@section usage Usage

Include romcat.hpp to pull in the whole library. Nothing in the library uses global state: build a
`romcat::Configuration` (optionally with `romcat::LoadConfiguration`) and pass the relevant parts to the components that
need them.



@subsection catalog Opening the catalog

`romcat::catalog::CatalogDB` owns an SQLite database. Open it with `Open(path, error)` or `OpenInMemory(error)`; the
schema is created or migrated on open, and databases written by a newer version of the library are rejected with
`romcat::catalog::CatalogError::SchemaTooNew`.

Curated platforms, companies and overrides live in TOML files under the definitions directory. Load them with
`romcat::catalog::LoadDefinitions` and write them into the catalog with `romcat::catalog::SeedCatalog`.



@subsection identify Identifying dumps

Build a `romcat::db::HashIndex` from the records of a reference database. The index is immutable and may be shared
between threads. Use `romcat::media::HashFile` to compute the CRC32, SHA-1 and MD5 of a file, skipping the header bytes
reported by `romcat::media::DeriveHeaderSkip`, and look the digests up with `romcat::db::HashIndex::LookupDigests`.

`romcat::import::ScanFiles` does all of this for a batch of files and reports each classification to an
`romcat::import::IScanListener`.



@subsection repair Repairing dumps

`romcat::repair::FindRepair` and `romcat::repair::FindRepairAny` test padding hypotheses against the index without
modifying the file. Once a repair is confirmed, `romcat::repair::ApplyRepair` writes the padding, optionally keeping a
backup of the original.



@subsection import Importing reference data

`romcat::import::ImportReferenceRecords` creates or updates works, releases and media from reference records. Facts that
conflict with what the catalog already holds are recorded as disagreements rather than overwritten; list them with
`romcat::catalog::CatalogDB::ListUnresolvedDisagreements` and close them with
`romcat::catalog::CatalogDB::ResolveDisagreement`.

After importing, `romcat::import::ApplyOverrides` reapplies curated corrections and `romcat::import::ReconcileWorks`
merges works that were created under inconsistent names.
*/
