#include <iostream>

void test_tokenize();
void test_tokenize_unicode();
void test_term_frequency();
void test_term_weighting();
void test_degenerate_corpus();
void test_embedding_cache_hits();
void test_embedding_cache_lru();
void test_embedding_cache_batch();
void test_embedding_cache_retrain_purges();
void test_embedding_cache_zero_capacity();
void test_cosine_similarity();
void test_find_similar_sample_corpus();
void test_find_similar_edge_cases();
void test_find_similar_stable_ties();
void test_find_similar_pins_one_table();
void test_find_similar_during_retrain();
void test_classify_outcome();
void test_risk();
void test_risk_matrix();
void test_risk_aggregate();
void test_risk_recommendations();
void test_iso8601();
void test_text_helpers();
void test_alert_severity_bands();
void test_alert_fields();
void test_sentiment_aggregation();
void test_indicator_checks();
void test_alert_monitor();
void test_alert_monitor_isolation();
void test_consensus_summary();
void test_consensus_gather();
void test_analyzer();
void test_analyzer_retrain();

int main() {
  test_tokenize();
  test_tokenize_unicode();
  test_term_frequency();
  test_term_weighting();
  test_degenerate_corpus();
  test_embedding_cache_hits();
  test_embedding_cache_lru();
  test_embedding_cache_batch();
  test_embedding_cache_retrain_purges();
  test_embedding_cache_zero_capacity();
  test_cosine_similarity();
  test_find_similar_sample_corpus();
  test_find_similar_edge_cases();
  test_find_similar_stable_ties();
  test_find_similar_pins_one_table();
  test_find_similar_during_retrain();
  test_classify_outcome();
  test_risk();
  test_risk_matrix();
  test_risk_aggregate();
  test_risk_recommendations();
  test_iso8601();
  test_text_helpers();
  test_alert_severity_bands();
  test_alert_fields();
  test_sentiment_aggregation();
  test_indicator_checks();
  test_alert_monitor();
  test_alert_monitor_isolation();
  test_consensus_summary();
  test_consensus_gather();
  test_analyzer();
  test_analyzer_retrain();
  std::cout << "sonar_tests ok\n";
  return 0;
}
