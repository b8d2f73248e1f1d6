#include "sonar/SampleCorpus.h"

namespace sonar {

Corpus sample_corpus() {
  Corpus c;
  c.push_back(PolicyRecord{
      1, "Tariff increase of 25% on imported steel and aluminum", 2018, "Trade", "National",
      {"trade retaliation", "price inflation"},
      "2.6% price increase in construction sector, -0.2% employment in manufacturing"});
  c.push_back(PolicyRecord{
      2, "Tax credit of 30% for renewable energy investments", 2009, "Energy", "National",
      {"budget deficit", "market distortion"},
      "12% growth in renewable sector, +3.1% in green energy jobs"});
  c.push_back(PolicyRecord{
      3, "Minimum wage increase to $15 per hour", 2021, "Labor", "State",
      {"small business impact", "inflation"},
      "10% wage increase for bottom quartile, 2% reduction in low-wage employment"});
  return c;
}

} // namespace sonar
