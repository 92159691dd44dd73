#include <boost/test/unit_test.hpp>

#include "../core/locio.hpp"
#include "../core/random.hpp"
#include "../core/refloci.hpp"
#include "../core/refloci/Snapshot.hpp"
#include "../core/storage.hpp"
#include <boost/filesystem.hpp>
#include <boost/format.hpp>
#include <memory>
#include <set>
#include <string>
#include <vector>

using namespace std;
using namespace locio;
using namespace refloci;
using boost::format;
using boost::str;
using storage::BlobStore;
using storage::MemBlobStore;
namespace fs = boost::filesystem;

/** Memory store that rejects writes while full. */
struct FullBlobStore : public MemBlobStore
{
  FullBlobStore() : is_full(false) {}
  void put(const string& name, const string& data) override {
    if (is_full) {
      throw StorageError(str(format("Cannot write blob '%s': no space left on device.") % name));
    }
    MemBlobStore::put(name, data);
  }
  bool is_full;
};

struct FixtureRefLoci {
  FixtureRefLoci()
  : store(make_shared<MemBlobStore>()),
    a("chr8", 100, 150, STRAND_PLUS),
    b("chr8", 160, 175, STRAND_PLUS),
    c("chr8", 180, 200, STRAND_MINUS),
    x("chr9", 100, 150, STRAND_PLUS)
  {
    BOOST_TEST_MESSAGE( "setup fixure" );
    a.name = string("GENE_A");
    a.kind = FEAT_GENE;
    b.name = string("GENE_B");
    b.kind = FEAT_GENE;
    c.name = string("GENE_C");
    c.kind = FEAT_GENE;
    x.kind = FEAT_SNP;
  }
  ~FixtureRefLoci() {
    BOOST_TEST_MESSAGE( "teardown fixture" );
  }

  /** Frozen collection "genes" holding a, b, c and x (ids 0-3). */
  RefLoci frozenGenes() {
    RefLoci ref(store, "genes");
    ref.insert(vector<Locus>{ a, b, c, x });
    ref.freeze("genes");
    return ref;
  }

  shared_ptr<BlobStore> store;
  Locus a, b, c, x;
};

BOOST_FIXTURE_TEST_SUITE( refloci_store, FixtureRefLoci )

BOOST_AUTO_TEST_CASE( lifecycle )
{
  RefLoci ref(store, "draft");
  BOOST_CHECK_EQUAL( ref.state(), STATE_BUILDING );
  BOOST_CHECK( ref.empty() );

  vector<TLocusId> ids = ref.insert(vector<Locus>{ a, b, c });
  BOOST_REQUIRE_EQUAL( ids.size(), 3 );
  BOOST_CHECK_EQUAL( ids[0], 0 );
  BOOST_CHECK_EQUAL( ids[2], 2 );
  BOOST_CHECK_EQUAL( *ref.getLocus(1).id, 1 );
  BOOST_CHECK( a.isDetached() );

  ref.remove(1);
  BOOST_CHECK( !ref.contains(1) );
  BOOST_CHECK_THROW( ref.remove(1), NotFoundError );
  BOOST_CHECK_THROW( ref.getLocus(1), NotFoundError );
  // ids are never reused
  BOOST_CHECK_EQUAL( ref.insert(b), 3 );

  ref.freeze("genes");
  BOOST_CHECK_EQUAL( ref.name(), "genes" );
  BOOST_CHECK_EQUAL( ref.state(), STATE_FROZEN );
  BOOST_CHECK( ref.isFrozen() );
  BOOST_CHECK( RefLoci::exists(*store, "genes") );
  BOOST_CHECK_THROW( ref.insert(x), StateError );
  BOOST_CHECK_THROW( ref.remove(0), StateError );
  BOOST_CHECK_THROW( ref.freeze("genes2"), StateError );

  ref.thaw();
  BOOST_CHECK_EQUAL( ref.state(), STATE_BUILDING );
  BOOST_CHECK_THROW( ref.thaw(), StateError );
  BOOST_CHECK_EQUAL( ref.insert(x), 4 );
  // index follows mutations
  BOOST_CHECK_EQUAL( ref.queryOverlap("chr9", Interval(0, 1000)).size(), 1 );
}

BOOST_AUTO_TEST_CASE( freeze_validation )
{
  RefLoci empty(store, "empty");
  BOOST_CHECK_THROW( empty.freeze("empty"), StateError );
  BOOST_CHECK_THROW( RefLoci::load(store, "empty"), NotFoundError );

  RefLoci ref(store, "genes");
  ref.insert(a);
  BOOST_CHECK_THROW( ref.freeze(""), ValidationError );
  BOOST_CHECK_THROW( ref.freeze("a/b"), ValidationError );
  BOOST_CHECK_EQUAL( ref.state(), STATE_BUILDING );
  BOOST_CHECK_EQUAL( ref.name(), "genes" );
  ref.freeze("genes");

  RefLoci other(store, "genes");
  other.insert(b);
  BOOST_CHECK_THROW( other.freeze("genes"), StateError );
  BOOST_CHECK_EQUAL( other.state(), STATE_BUILDING );
  other.freeze("genes", true);
  RefLoci loaded = RefLoci::load(store, "genes");
  BOOST_REQUIRE_EQUAL( loaded.size(), 1 );
  BOOST_CHECK_EQUAL( loaded.getLocus(0), b );

  BOOST_CHECK_THROW( RefLoci(shared_ptr<BlobStore>(), "none"), ValidationError );
}

/* every field survives freeze/load */
BOOST_AUTO_TEST_CASE( round_trip )
{
  Locus gene("chr1", 1000, 5000, STRAND_MINUS);
  gene.name = string("TP53");
  gene.kind = FEAT_GENE;
  gene.source = "ensembl";
  gene.setAttr("gene_id", "ENSG00000141510");
  gene.setAttr("score", 0.75);
  gene.setAttr("exons", 11L);
  gene.setAttr("canonical", true);
  Locus cds("chr1", 1200, 1300, STRAND_MINUS);
  cds.kind = FEAT_CDS;
  cds.frame = 2;
  gene.addSublocus(cds);
  Locus snp("chrX", 10, 11);
  snp.name = string("rs123");
  snp.kind = FEAT_SNP;

  RefLoci ref(store, "full");
  ref.insert(a);
  ref.insert(gene);
  ref.insert(snp);
  ref.remove(0);
  ref.freeze("full");

  RefLoci loaded = RefLoci::load(store, "full");
  BOOST_CHECK_EQUAL( loaded.state(), STATE_LOADED );
  BOOST_CHECK_EQUAL( loaded.name(), "full" );
  BOOST_REQUIRE_EQUAL( loaded.size(), 2 );
  BOOST_CHECK( !loaded.contains(0) );

  const Locus& g = loaded.getLocus(1);
  BOOST_CHECK_EQUAL( *g.id, 1 );
  BOOST_CHECK_EQUAL( g, gene );
  BOOST_CHECK_EQUAL( g.strand, STRAND_MINUS );
  BOOST_CHECK_EQUAL( *g.name, "TP53" );
  BOOST_CHECK_EQUAL( g.kind, FEAT_GENE );
  BOOST_CHECK_EQUAL( g.source, "ensembl" );
  BOOST_CHECK( !g.frame );
  BOOST_CHECK( g.attrs == gene.attrs );
  BOOST_CHECK_EQUAL( boost::get<string>(g.getAttr("gene_id")), "ENSG00000141510" );
  BOOST_CHECK_EQUAL( boost::get<double>(g.getAttr("score")), 0.75 );
  BOOST_CHECK_EQUAL( boost::get<long>(g.getAttr("exons")), 11 );
  BOOST_CHECK_EQUAL( boost::get<bool>(g.getAttr("canonical")), true );
  BOOST_REQUIRE_EQUAL( g.sub_loci.size(), 1 );
  BOOST_CHECK_EQUAL( g.sub_loci[0], cds );
  BOOST_CHECK_EQUAL( g.sub_loci[0].kind, FEAT_CDS );
  BOOST_REQUIRE( g.sub_loci[0].frame );
  BOOST_CHECK_EQUAL( *g.sub_loci[0].frame, 2 );

  const Locus& s = loaded.getLocus(2);
  BOOST_CHECK_EQUAL( s.strand, STRAND_UNKNOWN );
  BOOST_CHECK_EQUAL( *s.name, "rs123" );
  BOOST_CHECK_EQUAL( s.kind, FEAT_SNP );

  // ids continue after the highest id ever assigned
  RefLoci copy = loaded.workingCopy("full2");
  BOOST_CHECK_EQUAL( copy.insert(b), 3 );
  BOOST_CHECK_EQUAL( loaded.size(), 2 );
  BOOST_CHECK_THROW( loaded.insert(b), StateError );
}

BOOST_AUTO_TEST_CASE( list_and_drop )
{
  RefLoci genes = frozenGenes();
  RefLoci other(store, "snps");
  other.insert(x);
  other.freeze("snps");
  Term term("apoptosis");
  term.addLocus(a);
  term.freeze(*store);

  vector<string> names = RefLoci::listNames(*store);
  BOOST_REQUIRE_EQUAL( names.size(), 2 );
  BOOST_CHECK_EQUAL( names[0], "genes" );
  BOOST_CHECK_EQUAL( names[1], "snps" );

  RefLoci loaded = RefLoci::load(store, "genes");
  RefLoci::drop(*store, "genes");
  BOOST_CHECK( !RefLoci::exists(*store, "genes") );
  BOOST_CHECK_THROW( RefLoci::drop(*store, "genes"), NotFoundError );
  BOOST_CHECK_THROW( RefLoci::load(store, "genes"), NotFoundError );
  // loaded copies stay usable
  BOOST_CHECK_EQUAL( loaded.queryOverlap("chr8", Interval(0, 1000)).size(), 3 );
  BOOST_CHECK_EQUAL( RefLoci::listNames(*store).size(), 1 );

  // thawed collections can be frozen under a new name
  loaded.thaw("genes_v2");
  loaded.insert(Locus("chr10", 0, 10));
  loaded.freeze("genes_v2");
  BOOST_CHECK_EQUAL( RefLoci::load(store, "genes_v2").size(), 5 );
}

BOOST_AUTO_TEST_CASE( corrupt_blob )
{
  store->put("refloci.bad", "this is not an archive");
  BOOST_CHECK_THROW( RefLoci::load(store, "bad"), StorageError );

  // truncated archive
  frozenGenes();
  string blob = store->get("refloci.genes");
  store->put("refloci.cut", blob.substr(0, blob.size() / 2));
  BOOST_CHECK_THROW( RefLoci::load(store, "cut"), StorageError );
}

BOOST_AUTO_TEST_CASE( dir_store_persistence )
{
  fs::path dir = fs::temp_directory_path() / fs::unique_path("locistore-refloci-%%%%-%%%%");
  {
    shared_ptr<BlobStore> dir_store = make_shared<storage::DirBlobStore>(dir);
    RefLoci ref(dir_store, "genes");
    ref.insert(vector<Locus>{ a, b, c });
    ref.freeze("genes");
  }
  shared_ptr<BlobStore> dir_store = make_shared<storage::DirBlobStore>(dir);
  RefLoci loaded = RefLoci::load(dir_store, "genes");
  BOOST_CHECK_EQUAL( loaded.size(), 3 );
  BOOST_CHECK_EQUAL( *loaded.getLocus(2).name, "GENE_C" );

  boost::system::error_code ec;
  fs::remove_all(dir, ec);
}

/* a=(chr8,100,150,+), b=(chr8,160,175,+), c=(chr8,180,200,-) */
BOOST_AUTO_TEST_CASE( range_queries )
{
  RefLoci ref = frozenGenes();
  RefLoci loaded = RefLoci::load(store, "genes");

  vector<Locus> hits = loaded.queryOverlap("chr8", Interval(140, 170));
  BOOST_REQUIRE_EQUAL( hits.size(), 2 );
  BOOST_CHECK_EQUAL( *hits[0].id, 0 );
  BOOST_CHECK_EQUAL( *hits[1].id, 1 );

  boost::optional<Locus> up = loaded.nearest("chr8", 205, UPSTREAM);
  BOOST_REQUIRE( up );
  BOOST_CHECK_EQUAL( *up->id, 2 );
  BOOST_CHECK( !loaded.nearest("chr9", 50, UPSTREAM) );
  BOOST_CHECK( loaded.queryOverlap("chrY", Interval(0, 1000)).empty() );

  hits = loaded.queryWindow("chr8", 165, 3);
  BOOST_REQUIRE_EQUAL( hits.size(), 1 );
  BOOST_CHECK_EQUAL( *hits[0].name, "GENE_B" );
  BOOST_CHECK_THROW( loaded.queryWindow("chr8", 165, -3), ValidationError );

  // strand-aware overlap
  Locus q("chr8", 170, 190, STRAND_PLUS);
  BOOST_CHECK_EQUAL( loaded.queryOverlap(q).size(), 2 );
  hits = loaded.queryOverlap(q, AlgebraOpts(true));
  BOOST_REQUIRE_EQUAL( hits.size(), 1 );
  BOOST_CHECK_EQUAL( hits[0], b );

  vector<string> chrs = loaded.chromosomes();
  BOOST_REQUIRE_EQUAL( chrs.size(), 2 );
  BOOST_CHECK_EQUAL( chrs[1], "chr9" );
}

BOOST_AUTO_TEST_CASE( containment_queries )
{
  RefLoci ref = frozenGenes();

  Locus span("chr8", 90, 210, STRAND_PLUS);
  vector<Locus> in = ref.within(span);
  BOOST_REQUIRE_EQUAL( in.size(), 3 );
  BOOST_CHECK_EQUAL( in[0], a );
  BOOST_CHECK_EQUAL( in[2], c );
  BOOST_CHECK_EQUAL( ref.within(span, false, true).size(), 2 );

  // results run 5' to 3' of the query strand
  span.strand = STRAND_MINUS;
  in = ref.within(span);
  BOOST_REQUIRE_EQUAL( in.size(), 3 );
  BOOST_CHECK_EQUAL( in[0], c );
  BOOST_CHECK_EQUAL( in[2], a );

  Locus part("chr8", 140, 170, STRAND_PLUS);
  BOOST_CHECK( ref.within(part).empty() );
  BOOST_CHECK_EQUAL( ref.within(part, true).size(), 2 );

  vector<Locus> outer = ref.encompassing(Locus("chr8", 165, 170));
  BOOST_REQUIRE_EQUAL( outer.size(), 1 );
  BOOST_CHECK_EQUAL( *outer[0].name, "GENE_B" );
  BOOST_CHECK( ref.encompassing(Locus("chr8", 140, 170)).empty() );

  BOOST_CHECK( ref.containsLocus(Locus("chr8", 100, 150, STRAND_PLUS)) );
  BOOST_CHECK( !ref.containsLocus(Locus("chr8", 100, 150, STRAND_MINUS)) );

  vector<Locus> common = ref.intersection({ Locus("chr8", 180, 200, STRAND_MINUS), a, a, Locus("chr1", 1, 2) });
  BOOST_REQUIRE_EQUAL( common.size(), 2 );
  BOOST_CHECK_EQUAL( *common[0].id, 0 );
  BOOST_CHECK_EQUAL( *common[1].id, 2 );

  vector<Locus> named = ref.findByName("GENE_C");
  BOOST_REQUIRE_EQUAL( named.size(), 1 );
  BOOST_CHECK_EQUAL( *named[0].id, 2 );
  BOOST_CHECK( ref.findByName("GENE_Z").empty() );

  map<FeatureKind, size_t> kinds = ref.summarizeFeatureKinds();
  BOOST_CHECK_EQUAL( kinds[FEAT_GENE], 3 );
  BOOST_CHECK_EQUAL( kinds[FEAT_SNP], 1 );
}

BOOST_AUTO_TEST_CASE( flanking_queries )
{
  RefLoci ref = frozenGenes();
  const Locus& gb = ref.getLocus(1);
  const Locus& gc = ref.getLocus(2);

  // plus strand: upstream is towards lower coordinates
  vector<Locus> up = ref.upstreamLoci(gb);
  BOOST_REQUIRE_EQUAL( up.size(), 1 );
  BOOST_CHECK_EQUAL( up[0], a );
  vector<Locus> down = ref.downstreamLoci(gb);
  BOOST_REQUIRE_EQUAL( down.size(), 1 );
  BOOST_CHECK_EQUAL( down[0], c );

  // minus strand: upstream is towards higher coordinates
  BOOST_CHECK( ref.upstreamLoci(gc).empty() );
  FlankOpts opts;
  opts.limit = 5;
  down = ref.downstreamLoci(gc, opts);
  BOOST_REQUIRE_EQUAL( down.size(), 2 );
  BOOST_CHECK_EQUAL( down[0], b );
  BOOST_CHECK_EQUAL( down[1], a );

  opts.same_strand = true;
  BOOST_CHECK( ref.downstreamLoci(gc, opts).empty() );
  opts.same_strand = false;
  opts.max_distance = 10;
  BOOST_CHECK_EQUAL( ref.downstreamLoci(gc, opts).size(), 1 );

  // loci straddling the query edges
  Locus q("chr8", 120, 165, STRAND_PLUS);
  FlankOpts partial;
  partial.partial = true;
  partial.limit = 2;
  up = ref.upstreamLoci(q, partial);
  BOOST_REQUIRE_EQUAL( up.size(), 1 );
  BOOST_CHECK_EQUAL( up[0], a );
  down = ref.downstreamLoci(q, partial);
  BOOST_REQUIRE_EQUAL( down.size(), 2 );
  BOOST_CHECK_EQUAL( down[0], b );
  BOOST_CHECK_EQUAL( down[1], c );
  partial.partial = false;
  BOOST_CHECK( ref.upstreamLoci(q, partial).empty() );

  pair<vector<Locus>, vector<Locus>> flanks = ref.flankingLoci(gb);
  BOOST_CHECK_EQUAL( flanks.first.size(), 1 );
  BOOST_CHECK_EQUAL( flanks.second.size(), 1 );
}

BOOST_AUTO_TEST_CASE( candidate_loci )
{
  RefLoci ref = frozenGenes();
  Locus snp("chr8", 165, 166);
  snp.name = string("rs1");

  CandidateOpts opts;
  opts.flank_limit = 1;
  opts.annotate = true;
  vector<Locus> cand = ref.candidateLoci(snp, opts);
  BOOST_REQUIRE_EQUAL( cand.size(), 3 );
  BOOST_CHECK_EQUAL( cand[0], a );
  BOOST_CHECK_EQUAL( cand[1], b );
  BOOST_CHECK_EQUAL( cand[2], c );
  BOOST_CHECK_EQUAL( boost::get<string>(cand[1].getAttr("parent_locus")), "rs1" );
  BOOST_CHECK_EQUAL( boost::get<long>(cand[1].getAttr("num_siblings")), 3 );
  BOOST_CHECK_EQUAL( boost::get<long>(cand[1].getAttr("locus_distance")), 2 );
  BOOST_CHECK_EQUAL( boost::get<long>(cand[0].getAttr("locus_distance")), 40 );
  // b (2 bp) is closer than c (24 bp) and a (40 bp)
  BOOST_CHECK_EQUAL( boost::get<double>(cand[1].getAttr("intervening_rank")), 1.0 );
  BOOST_CHECK_EQUAL( boost::get<double>(cand[2].getAttr("intervening_rank")), 2.0 );
  BOOST_CHECK_EQUAL( boost::get<double>(cand[0].getAttr("intervening_rank")), 3.0 );
  // b contains the query, a and c are the closest on their side
  BOOST_CHECK_EQUAL( boost::get<long>(cand[1].getAttr("num_intervening")), -1 );
  BOOST_CHECK_EQUAL( boost::get<long>(cand[0].getAttr("num_intervening")), 0 );
  BOOST_CHECK_EQUAL( boost::get<long>(cand[2].getAttr("num_intervening")), 0 );
  // canonical copies are not modified
  BOOST_CHECK( !ref.getLocus(1).hasAttr("parent_locus") );

  opts.flank_limit = 0;
  opts.annotate = false;
  cand = ref.candidateLoci(snp, opts);
  BOOST_REQUIRE_EQUAL( cand.size(), 1 );
  BOOST_CHECK( !cand[0].hasAttr("parent_locus") );
  opts.window = 20;
  BOOST_CHECK_EQUAL( ref.candidateLoci(snp, opts).size(), 3 );
  opts.window = -1;
  BOOST_CHECK_THROW( ref.candidateLoci(snp, opts), ValidationError );
}

BOOST_AUTO_TEST_CASE( random_loci )
{
  RandomNumberGenerator<> rng(42);
  RefLoci ref(store, "random");
  for (int i=0; i<100; ++i) {
    ref.insert(Locus(str(format("chr%d") % (i % 5 + 1)), i * 10, i * 10 + 5));
  }
  vector<Locus> sample = ref.randomLoci(50, rng);
  BOOST_REQUIRE_EQUAL( sample.size(), 50 );
  set<TLocusId> ids;
  for (const Locus& l : sample) {
    BOOST_REQUIRE( l.id );
    ids.insert(*l.id);
  }
  BOOST_CHECK_EQUAL( ids.size(), 50 );
  BOOST_CHECK_EQUAL( ref.randomLoci(100, rng).size(), 100 );
  BOOST_CHECK( ref.randomLoci(0, rng).empty() );
  BOOST_CHECK_THROW( ref.randomLoci(101, rng), ValidationError );
}

BOOST_AUTO_TEST_CASE( insert_validation )
{
  RefLoci ref(store, "genes");
  ref.insert(a);
  BOOST_CHECK_THROW( ref.insert(Locus()), ValidationError );
  Locus composite = b;
  composite.sub_loci.push_back(Locus());
  BOOST_CHECK_THROW( ref.insert(composite), ValidationError );
  // batches are inserted completely or not at all
  BOOST_CHECK_THROW( ref.insert(vector<Locus>{ c, Locus() }), ValidationError );
  BOOST_CHECK_EQUAL( ref.size(), 1 );
  BOOST_CHECK( !ref.contains(1) );

  // the collection stays loadable
  ref.insert(c);
  ref.freeze("genes");
  RefLoci loaded = RefLoci::load(store, "genes");
  BOOST_CHECK_EQUAL( loaded.size(), 2 );
  BOOST_CHECK_EQUAL( *loaded.getLocus(1).name, "GENE_C" );
}

/* a thawed collection replaces its own snapshot on the next freeze */
BOOST_AUTO_TEST_CASE( refreeze )
{
  RefLoci ref = frozenGenes();
  BOOST_CHECK( ref.ownsSnapshot() );
  ref.thaw();
  ref.insert(Locus("chr10", 0, 10));
  // the snapshot is unchanged until frozen again
  BOOST_CHECK_EQUAL( RefLoci::load(store, "genes").size(), 4 );
  ref.freeze(ref.name());
  BOOST_CHECK_EQUAL( ref.state(), STATE_FROZEN );
  BOOST_CHECK_EQUAL( RefLoci::load(store, "genes").size(), 5 );

  // same for loaded collections
  RefLoci loaded = RefLoci::load(store, "genes");
  BOOST_CHECK( loaded.ownsSnapshot() );
  loaded.thaw();
  loaded.remove(4);
  loaded.freeze("genes");
  BOOST_CHECK_EQUAL( RefLoci::load(store, "genes").size(), 4 );

  // other collections named alike still need overwrite
  RefLoci copy = loaded.workingCopy("genes");
  BOOST_CHECK( !copy.ownsSnapshot() );
  copy.remove(0);
  BOOST_CHECK_THROW( copy.freeze("genes"), StateError );
  copy.freeze("genes", true);
  BOOST_CHECK_EQUAL( RefLoci::load(store, "genes").size(), 3 );

  ref.thaw("genes_v2");
  BOOST_CHECK( !ref.ownsSnapshot() );
  BOOST_CHECK_THROW( ref.freeze("genes"), StateError );
  ref.freeze("genes_v2");
  BOOST_CHECK( ref.ownsSnapshot() );
}

/* a failed write leaves the collection mutable under its old name */
BOOST_AUTO_TEST_CASE( freeze_storage_failure )
{
  shared_ptr<FullBlobStore> full = make_shared<FullBlobStore>();
  RefLoci ref(full, "draft");
  ref.insert(vector<Locus>{ a, b });

  full->is_full = true;
  BOOST_CHECK_THROW( ref.freeze("genes"), StorageError );
  BOOST_CHECK_EQUAL( ref.state(), STATE_BUILDING );
  BOOST_CHECK_EQUAL( ref.name(), "draft" );
  BOOST_CHECK( !ref.ownsSnapshot() );
  BOOST_CHECK( RefLoci::listNames(*full).empty() );
  BOOST_CHECK_EQUAL( ref.insert(c), 2 );

  full->is_full = false;
  ref.freeze("genes");
  ref.thaw();
  ref.insert(x);
  full->is_full = true;
  BOOST_CHECK_THROW( ref.freeze("genes"), StorageError );
  BOOST_CHECK_EQUAL( ref.state(), STATE_BUILDING );
  BOOST_CHECK_EQUAL( RefLoci::load(full, "genes").size(), 3 );
}

BOOST_AUTO_TEST_CASE( feature_queries )
{
  Locus snp("chr8", 155, 156, STRAND_PLUS);
  snp.name = string("rs9");
  snp.kind = FEAT_SNP;
  RefLoci ref(store, "mixed");
  ref.insert(vector<Locus>{ a, b, c, x, snp });
  ref.freeze("mixed");

  vector<Locus> snps = ref.byFeature(FEAT_SNP);
  BOOST_REQUIRE_EQUAL( snps.size(), 2 );
  BOOST_CHECK_EQUAL( *snps[0].id, 3 );
  BOOST_CHECK_EQUAL( *snps[1].id, 4 );
  BOOST_CHECK( ref.byFeature(FEAT_EXON).empty() );

  vector<string> names = ref.featureNames(FEAT_SNP);
  BOOST_REQUIRE_EQUAL( names.size(), 1 );
  BOOST_CHECK_EQUAL( names[0], "rs9" );
  names = ref.featureNames(FEAT_GENE);
  BOOST_REQUIRE_EQUAL( names.size(), 3 );
  BOOST_CHECK_EQUAL( names[2], "GENE_C" );

  Locus span("chr8", 90, 210, STRAND_PLUS);
  BOOST_CHECK_EQUAL( ref.within(span).size(), 4 );
  BOOST_CHECK_EQUAL( ref.within(span, false, false, FEAT_GENE).size(), 3 );
  vector<Locus> in = ref.within(span, true, false, FEAT_SNP);
  BOOST_REQUIRE_EQUAL( in.size(), 1 );
  BOOST_CHECK_EQUAL( in[0], snp );

  const Locus& ga = ref.getLocus(0);
  const Locus& gb = ref.getLocus(1);
  BOOST_CHECK_EQUAL( ref.upstreamLoci(gb)[0], snp );
  BOOST_CHECK_EQUAL( ref.downstreamLoci(ga)[0], snp );
  FlankOpts genes_only;
  genes_only.kind = FEAT_GENE;
  vector<Locus> up = ref.upstreamLoci(gb, genes_only);
  BOOST_REQUIRE_EQUAL( up.size(), 1 );
  BOOST_CHECK_EQUAL( up[0], a );
  vector<Locus> down = ref.downstreamLoci(ga, genes_only);
  BOOST_REQUIRE_EQUAL( down.size(), 1 );
  BOOST_CHECK_EQUAL( down[0], b );

  // straddling loci are filtered too
  Locus q("chr8", 120, 165, STRAND_PLUS);
  genes_only.partial = true;
  down = ref.downstreamLoci(q, genes_only);
  BOOST_REQUIRE_EQUAL( down.size(), 1 );
  BOOST_CHECK_EQUAL( down[0], b );
  FlankOpts snps_only;
  snps_only.partial = true;
  snps_only.kind = FEAT_SNP;
  BOOST_CHECK( ref.downstreamLoci(q, snps_only).empty() );
}

BOOST_AUTO_TEST_CASE( aliases )
{
  RefLoci ref(store, "genes");
  ref.insert(vector<Locus>{ a, b, c });
  ref.addAlias(0, "ENSG_A");
  ref.addAlias(0, "ENSG_A");
  BOOST_CHECK_EQUAL( ref.numAliases(), 1 );
  BOOST_CHECK_THROW( ref.addAlias(1, "ENSG_A"), ValidationError );
  BOOST_CHECK_THROW( ref.addAlias(1, ""), ValidationError );
  BOOST_CHECK_THROW( ref.addAlias(9, "ENSG_X"), NotFoundError );
  ref.addAlias(1, "GENE_A");
  BOOST_CHECK_EQUAL( ref.numAliases(), 2 );

  vector<Locus> hits = ref.findByName("ENSG_A");
  BOOST_REQUIRE_EQUAL( hits.size(), 1 );
  BOOST_CHECK_EQUAL( *hits[0].id, 0 );
  // names and aliases are searched together
  hits = ref.findByName("GENE_A");
  BOOST_REQUIRE_EQUAL( hits.size(), 2 );
  BOOST_CHECK_EQUAL( *hits[0].id, 0 );
  BOOST_CHECK_EQUAL( *hits[1].id, 1 );

  ref.freeze("genes");
  BOOST_CHECK_THROW( ref.addAlias(2, "ENSG_C"), StateError );

  RefLoci loaded = RefLoci::load(store, "genes");
  BOOST_CHECK_EQUAL( loaded.numAliases(), 2 );
  BOOST_CHECK_EQUAL( loaded.findByName("ENSG_A").size(), 1 );

  RefLoci copy = loaded.workingCopy("genes2");
  copy.remove(0);
  BOOST_CHECK_EQUAL( copy.numAliases(), 1 );
  BOOST_CHECK( copy.findByName("ENSG_A").empty() );
  BOOST_CHECK_EQUAL( copy.findByName("GENE_A").size(), 1 );
}

BOOST_AUTO_TEST_CASE( corrupt_alias )
{
  LociSnapshot snap;
  snap.name = "bad";
  snap.next_id = 1;
  snap.loci[0] = a;
  snap.loci[0].id = TLocusId(0);
  snap.aliases["ENSG_A"] = 0;
  store->put("refloci.good", toBlob(snap));
  BOOST_CHECK_EQUAL( RefLoci::load(store, "good").numAliases(), 1 );

  snap.aliases["ENSG_X"] = 7;
  store->put("refloci.bad", toBlob(snap));
  BOOST_CHECK_THROW( RefLoci::load(store, "bad"), StorageError );
}

BOOST_AUTO_TEST_CASE( candidate_loci_multi )
{
  RefLoci ref = frozenGenes();
  Locus snp1("chr8", 165, 166);
  snp1.name = string("rs1");
  Locus snp2("chr8", 185, 186);
  snp2.name = string("rs2");
  Locus snp3("chr9", 120, 121);
  snp3.name = string("rs3");

  CandidateOpts opts;
  opts.flank_limit = 1;
  opts.annotate = true;
  vector<vector<Locus>> groups = ref.candidateLociByLocus({ snp3, snp2, snp1 }, opts);
  BOOST_REQUIRE_EQUAL( groups.size(), 3 );
  BOOST_CHECK_EQUAL( groups[0].size(), 3 );
  BOOST_REQUIRE_EQUAL( groups[1].size(), 2 );
  BOOST_CHECK_EQUAL( groups[1][0], b );
  BOOST_CHECK_EQUAL( groups[1][1], c );
  BOOST_REQUIRE_EQUAL( groups[2].size(), 1 );
  BOOST_CHECK_EQUAL( groups[2][0], x );

  vector<Locus> cand = ref.candidateLoci({ snp3, snp2, snp1 }, opts);
  BOOST_REQUIRE_EQUAL( cand.size(), 4 );
  BOOST_CHECK_EQUAL( cand[0], a );
  BOOST_CHECK_EQUAL( cand[3], x );
  // shared candidates keep the annotation of the leftmost query
  BOOST_CHECK_EQUAL( boost::get<string>(cand[1].getAttr("parent_locus")), "rs1" );
  BOOST_CHECK_EQUAL( boost::get<string>(cand[3].getAttr("parent_locus")), "rs3" );
  BOOST_CHECK( ref.candidateLoci(vector<Locus>(), opts).empty() );
}

BOOST_AUTO_TEST_CASE( bootstrap_candidates )
{
  RandomNumberGenerator<> rng(7);
  RefLoci ref(store, "tiled");
  for (int i=0; i<100; ++i) {
    ref.insert(Locus("chr1", i * 10, i * 10 + 5));
  }
  ref.freeze("tiled");

  CandidateOpts opts;
  opts.flank_limit = 2;
  opts.annotate = true;
  Locus q("chr1", 500, 501);
  BOOST_REQUIRE_EQUAL( ref.candidateLoci(q, opts).size(), 5 );
  for (int i=0; i<20; ++i) {
    vector<Locus> boot = ref.bootstrapCandidateLoci(q, opts, rng);
    BOOST_REQUIRE_EQUAL( boot.size(), 5 );
    // adjacent loci ending at the drawn one
    for (size_t j=1; j<boot.size(); ++j) {
      BOOST_CHECK_EQUAL( *boot[j].id, *boot[j-1].id + 1 );
    }
    BOOST_CHECK_EQUAL( boost::get<string>(boot[0].getAttr("parent_locus")), boot[4].toString() );
  }
  BOOST_CHECK( ref.bootstrapCandidateLoci(Locus("chr2", 0, 1), opts, rng).empty() );

  vector<Locus> queries{ Locus("chr1", 800, 801), q, Locus("chr1", 200, 201) };
  vector<Locus> boot = ref.bootstrapCandidateLoci(queries, opts, rng);
  BOOST_REQUIRE_EQUAL( boot.size(), 15 );
  set<TLocusId> ids;
  for (size_t j=0; j<boot.size(); ++j) {
    ids.insert(*boot[j].id);
    if (j > 0) {
      BOOST_CHECK( !(boot[j] < boot[j-1]) );
    }
  }
  BOOST_CHECK_EQUAL( ids.size(), 15 );

  // two blocks of three cannot be drawn from three loci
  RefLoci small(store, "small");
  small.insert(vector<Locus>{ Locus("chr1", 0, 5), Locus("chr1", 10, 15), Locus("chr1", 20, 25) });
  Locus q1("chr1", 10, 11);
  BOOST_CHECK_EQUAL( small.bootstrapCandidateLoci(q1, opts, rng).size(), 3 );
  BOOST_CHECK_THROW( small.bootstrapCandidateLoci({ q1, Locus("chr1", 12, 13) }, opts, rng), StateError );
}

BOOST_AUTO_TEST_SUITE_END()
